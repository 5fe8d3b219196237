#include "imgmgr/orientation.hpp"

#include "imgmgr/pixel_ops.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace imgmgr {

static constexpr uint16_t kOrientationTag = 0x0112;

int read_jpeg_orientation(const uint8_t* buf, std::size_t len)
{
    if (!buf || len < 12) return 1;
    if (buf[0] != 0xFF || buf[1] != 0xD8) return 1;  // SOI

    // 依各區段長度往後跳，直到 SOS；前面可能有很大的 APP2 (ICC) / APP13
    std::size_t pos = 2;
    while (pos + 4 < len) {
        if (buf[pos] != 0xFF) {
            ++pos;
            continue;
        }

        const uint8_t marker = buf[pos + 1];

        // fill bytes
        if (marker == 0xFF) {
            ++pos;
            continue;
        }

        // SOS / EOI：影像資料開始，後面不會有 APP1
        if (marker == 0xDA || marker == 0xD9) break;

        // 沒有長度欄位的 marker
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }

        const std::size_t seg_len = (static_cast<std::size_t>(buf[pos + 2]) << 8) | buf[pos + 3];
        if (seg_len < 2) return 1;

        if (marker == 0xE1 && pos + 10 < len
            && std::memcmp(buf + pos + 4, "Exif\0\0", 6) == 0) {

            const std::size_t tiff = pos + 10;
            const std::size_t seg_end = std::min(len, pos + 2 + seg_len);
            if (tiff + 8 > seg_end) return 1;

            const bool big_endian = (buf[tiff] == 'M');

            auto read16 = [&](std::size_t off) -> uint16_t {
                if (tiff + off + 2 > seg_end) return 0;
                const uint8_t* p = buf + tiff + off;
                return big_endian ? static_cast<uint16_t>((p[0] << 8) | p[1])
                                  : static_cast<uint16_t>(p[0] | (p[1] << 8));
            };
            auto read32 = [&](std::size_t off) -> uint32_t {
                if (tiff + off + 4 > seg_end) return 0;
                const uint8_t* p = buf + tiff + off;
                return big_endian
                    ? (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3]
                    : p[0] | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
            };

            // IFD0
            const uint32_t ifd = read32(4);
            if (ifd == 0 || tiff + ifd + 2 > seg_end) return 1;

            const uint16_t entries = read16(ifd);
            for (uint16_t i = 0; i < entries; ++i) {
                const std::size_t entry = ifd + 2 + static_cast<std::size_t>(i) * 12;
                if (tiff + entry + 12 > seg_end) break;

                if (read16(entry) == kOrientationTag) {
                    const uint16_t value = read16(entry + 8);
                    return (value >= 1 && value <= 8) ? value : 1;
                }
            }
            return 1;
        }

        pos += 2 + seg_len;
    }

    return 1;
}

int read_jpeg_orientation(const std::vector<uint8_t>& bytes)
{
    return read_jpeg_orientation(bytes.data(), bytes.size());
}

OrientationFix orientation_fix(int tag)
{
    switch (tag) {
    case 2: return {0,   true};
    case 3: return {180, false};
    case 4: return {180, true};
    case 5: return {270, true};
    case 6: return {270, false};
    case 7: return {90,  true};
    case 8: return {90,  false};
    default: return {};
    }
}

ImageU8 correct_orientation(const ImageU8& src, int tag)
{
    if (src.empty()) throw std::invalid_argument("correct_orientation: empty image");

    const OrientationFix fix = orientation_fix(tag);

    ImageU8 out = (fix.rotation != 0) ? rotate(src, fix.rotation)
                                      : ImageU8(src.h(), src.w(), src.c(), src.shared());
    if (fix.mirror) {
        out = flip_horizontal(out);
    }
    return out;
}

} // namespace imgmgr
