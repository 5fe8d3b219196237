#pragma once

#include "imgmgr/geometry.hpp"
#include "imgmgr/image.hpp"

namespace imgmgr {

// 來源矩形：w / h 可以是負的，代表由 (x, y) 那一欄（列）往回走
// 例如 {W-1, 0, -W, H} 就是整張圖左右鏡射
struct SourceRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

// resample：放大用 bilinear、縮小取整段面積平均，把 src 的 rect 區域取樣到 dst_w x dst_h
// preserve_alpha = true  → 4 通道照原樣內插（不混色），輸出維持 RGBA
// preserve_alpha = false → 4 通道以 alpha 疊在黑底上，輸出 RGB
ImageU8 resample(const ImageU8& src,
                 const SourceRect& rect,
                 int dst_w,
                 int dst_h,
                 bool preserve_alpha);

// 整張圖縮放
ImageU8 resize(const ImageU8& src,
               int new_w,
               int new_h,
               bool preserve_alpha);

// crop：從 (x, y) 開始取 width x height 區域，超出會自動 clamp
// 小數原點無條件捨去
ImageU8 crop(const ImageU8& src, const CropRect& rect);

// rotate：逆時針旋轉 90 / 180 / 270 度，90 / 270 時寬高互換
ImageU8 rotate(const ImageU8& src, int angle_deg);

// flip：水平鏡射（負寬度 resample）
ImageU8 flip_horizontal(const ImageU8& src);

} // namespace imgmgr
