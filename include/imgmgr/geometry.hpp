#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace imgmgr {

// 輸出模式
enum class TransformMode {
    Crop,        // 置中裁切
    CropTop,     // 從上緣裁切
    CropBottom,  // 從下緣裁切
    Fit,         // 等比例縮進 width x height 之內
    FitX,        // 寬度固定
    FitY,        // 高度固定
};

// "crop" / "crop-top" / "crop-bottom" / "fit" / "fit-x" / "fit-y"
// 其他字串丟 std::invalid_argument（設定錯誤，不是資料錯誤）
TransformMode parse_mode(std::string_view name);

// 也是快取目錄名稱
const char* mode_name(TransformMode mode);

bool is_crop_mode(TransformMode mode);

// 第二階段裁切：在中間尺寸 (render_width x render_height) 上取 width x height
// 原點可能是小數（例如 267/2 - 100 = 33.5），實際裁像素時無條件捨去
struct CropRect {
    double x = 0.0;
    double y = 0.0;
    int    width  = 0;
    int    height = 0;
};

struct TransformSpec {
    int render_width  = 0;
    int render_height = 0;
    std::optional<CropRect> crop;
};

// Geometry Engine：純函式，沒有 I/O
// 所有尺寸都必須 > 0，否則丟 std::invalid_argument
TransformSpec compute_transform_spec(int orig_width,
                                     int orig_height,
                                     int target_width,
                                     int target_height,
                                     TransformMode mode);

} // namespace imgmgr
