#include "imgmgr/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace imgmgr {

TransformMode parse_mode(std::string_view name)
{
    if (name == "crop")        return TransformMode::Crop;
    if (name == "crop-top")    return TransformMode::CropTop;
    if (name == "crop-bottom") return TransformMode::CropBottom;
    if (name == "fit")         return TransformMode::Fit;
    if (name == "fit-x")       return TransformMode::FitX;
    if (name == "fit-y")       return TransformMode::FitY;
    throw std::invalid_argument("Invalid mode: " + std::string(name));
}

const char* mode_name(TransformMode mode)
{
    switch (mode) {
    case TransformMode::Crop:       return "crop";
    case TransformMode::CropTop:    return "crop-top";
    case TransformMode::CropBottom: return "crop-bottom";
    case TransformMode::Fit:        return "fit";
    case TransformMode::FitX:       return "fit-x";
    case TransformMode::FitY:       return "fit-y";
    }
    throw std::invalid_argument("Invalid mode");
}

bool is_crop_mode(TransformMode mode)
{
    return mode == TransformMode::Crop
        || mode == TransformMode::CropTop
        || mode == TransformMode::CropBottom;
}

// 候選尺寸一律無條件進位，避免蓋不滿裁切框
// 比例相乘的誤差（例如 200.00000000000003）不算超出
static inline int ceil_dim(double v) {
    return std::max(1, static_cast<int>(std::ceil(v - 1e-9)));
}

// fit-x / fit-y 的「不拉伸」分支用四捨五入
static inline int round_dim(double v) {
    return std::max(1, static_cast<int>(std::round(v)));
}

// ======================
//  crop：先 cover-resize，再裁成 target 大小
// ======================
static TransformSpec cover_then_crop(int ow, int oh, int tw, int th, TransformMode mode)
{
    const double x_ratio = static_cast<double>(tw) / ow;
    const double y_ratio = static_cast<double>(th) / oh;

    int w = 0;
    int h = 0;

    if (ow > oh) {            // 原圖偏寬：高度對齊
        h = th;
        w = ceil_dim(y_ratio * ow);
    } else if (oh > ow) {     // 原圖偏高：寬度對齊
        w = tw;
        h = ceil_dim(x_ratio * oh);
    } else {                  // 正方形
        w = tw;
        h = tw;
    }

    // 寬度仍不足 → 改用寬度比例，避免左右黑邊
    if (w < tw) {
        w = tw;
        h = ceil_dim(x_ratio * oh);
    }
    // 高度仍不足 → 改用高度比例（偏高原圖配上更高的框、正方形配直框）
    if (h < th) {
        h = th;
        w = ceil_dim(y_ratio * ow);
    }

    CropRect rect;
    rect.width  = tw;
    rect.height = th;
    rect.x = w / 2.0 - tw / 2.0;

    switch (mode) {
    case TransformMode::CropTop:
        rect.y = 0.0;
        break;
    case TransformMode::CropBottom:
        rect.y = static_cast<double>(h - th);
        break;
    default:
        rect.y = h / 2.0 - th / 2.0;
        break;
    }

    TransformSpec spec;
    spec.render_width  = w;
    spec.render_height = h;
    spec.crop = rect;
    return spec;
}

// ======================
//  fit：等比例縮進框內，不放大
// ======================
static TransformSpec fit_within(int ow, int oh, int tw, int th)
{
    TransformSpec spec;

    if (ow <= tw && oh <= th) {
        spec.render_width  = ow;
        spec.render_height = oh;
        return spec;
    }

    const double x_ratio = static_cast<double>(tw) / ow;
    const double y_ratio = static_cast<double>(th) / oh;

    if (x_ratio * oh < th) {  // 偏寬：寬度頂到框
        spec.render_width  = tw;
        spec.render_height = ceil_dim(x_ratio * oh);
    } else {                  // 偏高：高度頂到框
        spec.render_width  = ceil_dim(y_ratio * ow);
        spec.render_height = th;
    }
    return spec;
}

TransformSpec compute_transform_spec(int orig_width,
                                     int orig_height,
                                     int target_width,
                                     int target_height,
                                     TransformMode mode)
{
    if (orig_width <= 0 || orig_height <= 0)
        throw std::invalid_argument("compute_transform_spec: invalid original size");
    if (target_width <= 0 || target_height <= 0)
        throw std::invalid_argument("compute_transform_spec: invalid target size");

    const int ow = orig_width;
    const int oh = orig_height;
    const int tw = target_width;
    const int th = target_height;

    switch (mode) {
    case TransformMode::Crop:
    case TransformMode::CropTop:
    case TransformMode::CropBottom:
        return cover_then_crop(ow, oh, tw, th, mode);

    case TransformMode::Fit:
        return fit_within(ow, oh, tw, th);

    case TransformMode::FitX: {
        TransformSpec spec;
        const int h = round_dim(static_cast<double>(oh) * tw / ow);
        if (oh <= h) {  // 原圖比算出來的還矮 → 不拉伸
            spec.render_width  = ow;
            spec.render_height = oh;
        } else {
            spec.render_width  = tw;
            spec.render_height = h;
        }
        return spec;
    }

    case TransformMode::FitY: {
        TransformSpec spec;
        const int w = round_dim(static_cast<double>(ow) * th / oh);
        if (ow <= w) {
            spec.render_width  = ow;
            spec.render_height = oh;
        } else {
            spec.render_width  = w;
            spec.render_height = th;
        }
        return spec;
    }
    }

    throw std::invalid_argument("Invalid mode");
}

} // namespace imgmgr
