#include "imgmgr/pixel_ops.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace imgmgr {

static inline std::size_t idx(int y, int x, int c,
                              int W, int C) {
    return (static_cast<std::size_t>(y) * W + x) * C + c;
}

// 一個輸出座標對應到的來源取樣點（index, weight），權重總和為 1
struct Tap {
    int   i;
    float w;
};

struct Taps {
    std::vector<Tap> taps;
    std::vector<int> begin;   // dst_n + 1 個，第 k 個輸出用 taps[begin[k], begin[k+1])
};

// step <= 1：目的像素中心 → 來源座標，兩點 bilinear
// step >  1：目的像素蓋住的整段來源取面積平均，邊界像素按覆蓋比例給權重
// dir < 0 時由 origin 往回走
static Taps build_taps(int origin, int extent, int dst_n, int src_n)
{
    Taps t;
    t.begin.reserve(static_cast<std::size_t>(dst_n) + 1);
    const float step = static_cast<float>(std::abs(extent)) / static_cast<float>(dst_n);
    const int   dir  = extent < 0 ? -1 : 1;

    for (int i = 0; i < dst_n; ++i) {
        t.begin.push_back(static_cast<int>(t.taps.size()));

        if (step <= 1.0f) {
            float s  = origin + dir * ((i + 0.5f) * step - 0.5f);
            int   s0 = static_cast<int>(std::floor(s));
            float f  = s - s0;

            t.taps.push_back({std::clamp(s0, 0, src_n - 1), 1.0f - f});
            t.taps.push_back({std::clamp(s0 + 1, 0, src_n - 1), f});
            continue;
        }

        const float a  = i * step;
        const float b  = (i + 1) * step;
        const int   k0 = static_cast<int>(std::floor(a));
        const int   k1 = static_cast<int>(std::ceil(b));
        for (int k = k0; k < k1; ++k) {
            const float w = std::min(b, k + 1.0f) - std::max(a, static_cast<float>(k));
            if (w <= 0.0f) continue;
            t.taps.push_back({std::clamp(origin + dir * k, 0, src_n - 1), w / step});
        }
    }
    t.begin.push_back(static_cast<int>(t.taps.size()));
    return t;
}

static inline uint8_t to_u8(float v) {
    v = std::round(v);
    v = std::clamp(v, 0.0f, 255.0f);
    return static_cast<uint8_t>(v);
}

// ======================
//  Resample（放大 bilinear，縮小面積平均）
// ======================
ImageU8 resample(const ImageU8& src,
                 const SourceRect& rect,
                 int dst_w,
                 int dst_h,
                 bool preserve_alpha)
{
    if (src.empty()) {
        throw std::invalid_argument("resample: empty image");
    }
    if (dst_h <= 0 || dst_w <= 0) {
        throw std::invalid_argument("resample: invalid new size");
    }
    if (rect.w == 0 || rect.h == 0) {
        throw std::invalid_argument("resample: empty source rect");
    }

    const int H = src.h();
    const int W = src.w();
    const int C = src.c();

    // 有 alpha 但不保留 → 疊在黑底上輸出 RGB
    const bool flatten = (C == 4 && !preserve_alpha);
    const int  OC      = flatten ? 3 : C;

    const uint8_t* in = src.data();
    ImageU8 dst(dst_h, dst_w, OC);
    uint8_t* out = dst.data();

    const Taps xs = build_taps(rect.x, rect.w, dst_w, W);
    const Taps ys = build_taps(rect.y, rect.h, dst_h, H);

    std::vector<float> acc(static_cast<std::size_t>(OC));

    for (int y = 0; y < dst_h; ++y) {
        const int y0 = ys.begin[y];
        const int y1 = ys.begin[y + 1];

        for (int x = 0; x < dst_w; ++x) {
            const int x0 = xs.begin[x];
            const int x1 = xs.begin[x + 1];

            std::fill(acc.begin(), acc.end(), 0.0f);

            for (int j = y0; j < y1; ++j) {
                const Tap& ty = ys.taps[j];
                for (int i = x0; i < x1; ++i) {
                    const Tap&  tx = xs.taps[i];
                    const float w  = tx.w * ty.w;
                    if (w == 0.0f) continue;

                    if (!flatten) {
                        for (int c = 0; c < C; ++c)
                            acc[c] += w * in[idx(ty.i, tx.i, c, W, C)];
                        continue;
                    }

                    // premultiplied，等同於先疊黑底再縮放
                    const float a = in[idx(ty.i, tx.i, 3, W, C)] / 255.0f;
                    for (int c = 0; c < 3; ++c)
                        acc[c] += w * in[idx(ty.i, tx.i, c, W, C)] * a;
                }
            }

            for (int c = 0; c < OC; ++c)
                out[idx(y, x, c, dst_w, OC)] = to_u8(acc[c]);
        }
    }

    return dst;
}

ImageU8 resize(const ImageU8& src,
               int new_w,
               int new_h,
               bool preserve_alpha)
{
    if (src.empty()) throw std::invalid_argument("resize: empty image");
    return resample(src, SourceRect{0, 0, src.w(), src.h()}, new_w, new_h, preserve_alpha);
}

// ======================
//  Crop
// ======================
ImageU8 crop(const ImageU8& src, const CropRect& rect)
{
    if (src.empty()) throw std::invalid_argument("crop: empty image");
    if (rect.height <= 0 || rect.width <= 0) throw std::invalid_argument("crop: invalid size");

    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    const int x0 = static_cast<int>(rect.x);
    const int y0 = static_cast<int>(rect.y);

    // clamp 範圍
    int y1 = std::clamp(y0, 0, H);
    int x1 = std::clamp(x0, 0, W);
    int y2 = std::clamp(y0 + rect.height, 0, H);
    int x2 = std::clamp(x0 + rect.width, 0, W);

    int out_h = std::max(0, y2 - y1);
    int out_w = std::max(0, x2 - x1);
    if (out_h == 0 || out_w == 0) {
        throw std::invalid_argument("crop: region outside image");
    }

    ImageU8 dst(out_h, out_w, C);
    uint8_t* out = dst.data();

    const std::size_t row_bytes = static_cast<std::size_t>(out_w) * C;
    for (int y = 0; y < out_h; ++y) {
        std::memcpy(out + idx(y, 0, 0, out_w, C),
                    in + idx(y1 + y, x1, 0, W, C),
                    row_bytes);
    }

    return dst;
}

// ======================
//  Rotate（逆時針，90 的倍數）
// ======================
ImageU8 rotate(const ImageU8& src, int angle_deg)
{
    if (src.empty()) throw std::invalid_argument("rotate: empty image");
    if (angle_deg % 90 != 0) throw std::invalid_argument("rotate: angle must be a multiple of 90");

    const int angle = ((angle_deg % 360) + 360) % 360;

    const int H = src.h();
    const int W = src.w();
    const int C = src.c();
    const uint8_t* in = src.data();

    const bool swap = (angle == 90 || angle == 270);
    const int DH = swap ? W : H;
    const int DW = swap ? H : W;

    ImageU8 dst(DH, DW, C);
    uint8_t* out = dst.data();

    for (int y = 0; y < DH; ++y) {
        for (int x = 0; x < DW; ++x) {
            int sx = x;
            int sy = y;
            switch (angle) {
            case 90:  sx = W - 1 - y; sy = x;          break;
            case 180: sx = W - 1 - x; sy = H - 1 - y;  break;
            case 270: sx = y;         sy = H - 1 - x;  break;
            default:  break;
            }
            for (int c = 0; c < C; ++c) {
                out[idx(y, x, c, DW, C)] = in[idx(sy, sx, c, W, C)];
            }
        }
    }

    return dst;
}

ImageU8 flip_horizontal(const ImageU8& src)
{
    if (src.empty()) throw std::invalid_argument("flip_horizontal: empty image");

    // 從最右邊那一欄開始、負寬度往左取樣
    const SourceRect mirrored{src.w() - 1, 0, -src.w(), src.h()};
    return resample(src, mirrored, src.w(), src.h(), true);
}

} // namespace imgmgr
