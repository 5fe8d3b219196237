#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "imgmgr/image.hpp"

namespace imgmgr {

// EXIF Orientation (0x0112)：1 = 正常，2..8 = 需要旋轉 / 鏡射
// 找不到 APP1 / tag，或值不在 1..8 → 回傳 1
int read_jpeg_orientation(const uint8_t* buf, std::size_t len);
int read_jpeg_orientation(const std::vector<uint8_t>& bytes);

// 每個 tag 對應的修正：先逆時針旋轉 rotation 度，再視需要水平鏡射
//   tag  rotation  mirror
//    2      0       yes
//    3    180       no
//    4    180       yes
//    5    270       yes
//    6    270       no
//    7     90       yes
//    8     90       no
struct OrientationFix {
    int  rotation = 0;
    bool mirror   = false;
};

OrientationFix orientation_fix(int tag);

// 純轉換：回傳修正後的新緩衝區，不動檔案
// 要不要寫回來源由呼叫端（ImageManager）決定
ImageU8 correct_orientation(const ImageU8& src, int tag);

} // namespace imgmgr
