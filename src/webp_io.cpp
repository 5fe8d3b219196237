#include "webp_io.hpp"

#include "imgmgr/errors.hpp"

#include <webp/decode.h>
#include <webp/encode.h>

#include <algorithm>
#include <memory>

namespace imgmgr {
namespace detail {

bool webp_info(const uint8_t* data, std::size_t size, int& w, int& h)
{
    return WebPGetInfo(data, size, &w, &h) != 0;
}

ImageU8 decode_webp(const uint8_t* data, std::size_t size)
{
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data, size, &features) != VP8_STATUS_OK) {
        throw Error(ErrorKind::DecodeFailure, "libwebp: failed to read features");
    }

    int w = 0, h = 0;
    const int c = features.has_alpha ? 4 : 3;
    uint8_t* raw = features.has_alpha ? WebPDecodeRGBA(data, size, &w, &h)
                                      : WebPDecodeRGB(data, size, &w, &h);
    if (!raw) {
        throw Error(ErrorKind::DecodeFailure, "libwebp: failed to decode");
    }

    // 像素由 libwebp 配置，交給 shared_ptr 用 WebPFree 釋放
    std::shared_ptr<uint8_t[]> sp(raw, [](uint8_t* p) { WebPFree(p); });
    return ImageU8(h, w, c, std::move(sp));
}

std::vector<uint8_t> encode_webp(const ImageU8& image, int quality)
{
    if (image.empty()) {
        throw Error(ErrorKind::EncodeFailure, "libwebp: empty image");
    }

    const int w = image.w();
    const int h = image.h();
    const float q = static_cast<float>(std::clamp(quality, 0, 100));

    // libwebp 只吃 RGB / RGBA，灰階先展開
    std::vector<uint8_t> expanded;
    const uint8_t* px = image.data();
    int c = image.c();
    if (c == 1) {
        expanded.resize(static_cast<std::size_t>(w) * h * 3);
        for (std::size_t i = 0, n = static_cast<std::size_t>(w) * h; i < n; ++i) {
            expanded[i * 3 + 0] = px[i];
            expanded[i * 3 + 1] = px[i];
            expanded[i * 3 + 2] = px[i];
        }
        px = expanded.data();
        c = 3;
    }

    uint8_t* out = nullptr;
    const std::size_t n = (c == 4) ? WebPEncodeRGBA(px, w, h, w * 4, q, &out)
                                   : WebPEncodeRGB(px, w, h, w * 3, q, &out);
    if (n == 0 || !out) {
        if (out) WebPFree(out);
        throw Error(ErrorKind::EncodeFailure, "libwebp: failed to encode");
    }

    std::vector<uint8_t> bytes(out, out + n);
    WebPFree(out);
    return bytes;
}

} // namespace detail
} // namespace imgmgr
