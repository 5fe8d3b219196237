#pragma once

#include <cstddef>
#include <string>

namespace imgmgr {

class CacheStore;

// 刪掉來源以及所有由它產生的衍生圖，回傳刪除的檔案數
//
// 走訪來源所在目錄整棵樹：
//   - 檔名與來源完全相同 → 刪除（不論在哪一層）
//   - 位於 <w>-<h>/<mode>/ 底下、主檔名相同、副檔名是可輸出格式 → 刪除（轉檔產生的衍生圖）
//     但來源目錄裡還有同名的另一張來源（例如 photo.png）時不刪，那個快取路徑也屬於它
// 不需要額外索引，靠的是快取路徑永遠不改主檔名
std::size_t delete_derivatives(CacheStore& store, const std::string& source);

} // namespace imgmgr
