#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace imgmgr {

class CacheStore;

// 最後一個 '.' 之後的部分（小寫）；沒有 '.' 時回傳整個名稱（小寫）
std::string file_extension(std::string_view filename);

// 最後一個 '.' 之前的部分；沒有 '.' 時回傳整個名稱
std::string file_stem(std::string_view filename);

// 換副檔名（最後一個 '.' 之後），format 原樣使用；沒有副檔名就補上
std::string substitute_extension(std::string_view filename, std::string_view format);

// 上傳檔名 slug："My_Photo@2x.JPG" → "my-photo-at-2x.jpg"
// ASCII 轉小寫；>= 0x80 的 UTF-8 bytes 視為文字保留
std::string slug(std::string_view filename);

// slug 後若 destination 已有同名檔，在第一個 '.' 前加上 "-<13 位 hex>" 直到不撞名
std::string unique_filename(std::string_view filename,
                            const std::filesystem::path& destination,
                            const CacheStore& store);

} // namespace imgmgr
