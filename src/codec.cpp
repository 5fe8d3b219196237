#include "imgmgr/codec.hpp"
#include "imgmgr/errors.hpp"

#include "gif_writer.hpp"
#include "webp_io.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <string>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace imgmgr {

namespace {

// stbi_write_*_to_func 的 callback：累加到 Bytes
void append_bytes(void* context, void* data, int size)
{
    auto* out = static_cast<Bytes*>(context);
    const auto* p = static_cast<const uint8_t*>(data);
    out->insert(out->end(), p, p + size);
}

int stb_len(const Bytes& bytes)
{
    if (bytes.size() > static_cast<std::size_t>(INT_MAX))
        throw Error(ErrorKind::DecodeFailure, "stb_image: buffer too large");
    return static_cast<int>(bytes.size());
}

class StbCodec final : public Codec {
public:
    std::optional<ImageInfo> probe(const Bytes& bytes) const override
    {
        ImageInfo info;
        info.mime = sniff_mime(bytes.data(), bytes.size());
        if (info.mime.empty()) return std::nullopt;

        if (info.mime == "image/webp") {
            if (!detail::webp_info(bytes.data(), bytes.size(), info.width, info.height))
                return std::nullopt;
            return info;
        }

        // BMP / TIFF 也試著拿尺寸，拿不到就留 0
        int comp = 0;
        if (bytes.size() <= static_cast<std::size_t>(INT_MAX)) {
            if (!stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                       &info.width, &info.height, &comp)) {
                info.width = info.height = 0;
            }
        }
        return info;
    }

    ImageU8 decode(const Bytes& bytes, ImageFormat format) const override
    {
        if (format == ImageFormat::Webp) {
            return detail::decode_webp(bytes.data(), bytes.size());
        }

        const int len = stb_len(bytes);

        // 先用 stbi_info 得知原始通道數：帶 alpha（2 或 4）→ 要 4，否則要 3
        int x_dummy = 0, y_dummy = 0, comp = 0;
        if (!stbi_info_from_memory(bytes.data(), len, &x_dummy, &y_dummy, &comp)) {
            throw Error(ErrorKind::DecodeFailure,
                        std::string("stb_image: failed to stbi_info (") + stbi_failure_reason() + ")");
        }
        const int desired_c = (comp == 2 || comp == 4) ? 4 : 3;

        int w = 0, h = 0, ch_in = 0;
        stbi_uc* raw = stbi_load_from_memory(bytes.data(), len, &w, &h, &ch_in, desired_c);
        if (!raw) {
            throw Error(ErrorKind::DecodeFailure,
                        std::string("stb_image: failed to load (") + stbi_failure_reason() + ")");
        }

        // 將 raw 交給 shared_ptr 管理，deleter 使用 stbi_image_free
        std::shared_ptr<uint8_t[]> sp(
            reinterpret_cast<uint8_t*>(raw),
            [](uint8_t* p){ stbi_image_free(p); }
        );

        return ImageU8(h, w, desired_c, std::move(sp));
    }

    Bytes encode(const ImageU8& image, ImageFormat format, int quality) const override
    {
        if (image.empty()) throw Error(ErrorKind::EncodeFailure, "encode: empty image");

        const int q = std::clamp(quality, 0, 100);
        const int w = image.w();
        const int h = image.h();
        const int c = image.c();

        Bytes out;
        switch (format) {
        case ImageFormat::Jpeg:
            // stb 的 quality 範圍是 1..100
            if (!stbi_write_jpg_to_func(append_bytes, &out, w, h, c, image.data(), std::max(1, q)))
                throw Error(ErrorKind::EncodeFailure, "stb_image_write: failed to write jpg");
            break;

        case ImageFormat::Png:
            // quality 90 → 壓縮等級 9
            stbi_write_png_compression_level =
                std::clamp(static_cast<int>(std::lround(q / 10.0)), 0, 9);
            if (!stbi_write_png_to_func(append_bytes, &out, w, h, c, image.data(), w * c))
                throw Error(ErrorKind::EncodeFailure, "stb_image_write: failed to write png");
            break;

        case ImageFormat::Webp:
            return detail::encode_webp(image, q);

        case ImageFormat::Gif:
            return detail::encode_gif(image);
        }

        if (out.empty()) throw Error(ErrorKind::EncodeFailure, "encode: no output");
        return out;
    }
};

} // namespace

std::shared_ptr<Codec> make_default_codec()
{
    return std::make_shared<StbCodec>();
}

} // namespace imgmgr
