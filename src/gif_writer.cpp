#include "gif_writer.hpp"

#include "imgmgr/errors.hpp"

#include <unordered_map>

namespace imgmgr {
namespace detail {

namespace {

constexpr int kRedLevels   = 6;
constexpr int kGreenLevels = 7;
constexpr int kBlueLevels  = 6;
constexpr int kCubeColors  = kRedLevels * kGreenLevels * kBlueLevels;  // 252
constexpr int kTransparent = kCubeColors;                               // 252
constexpr int kMinCodeSize = 8;
constexpr int kMaxCode     = 4095;

inline int quantize(int v, int levels) {
    return (v * (levels - 1) + 127) / 255;
}

inline uint8_t level_value(int q, int levels) {
    return static_cast<uint8_t>((q * 255 + (levels - 1) / 2) / (levels - 1));
}

void put_u16(std::vector<uint8_t>& out, int v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

// LSB-first bit packer，滿 255 bytes 就切一個 sub-block
class BlockWriter {
public:
    explicit BlockWriter(std::vector<uint8_t>& out) : out_(out) {}

    void write(int code, int size) {
        acc_ |= static_cast<uint32_t>(code) << bits_;
        bits_ += size;
        while (bits_ >= 8) {
            push(static_cast<uint8_t>(acc_ & 0xFF));
            acc_ >>= 8;
            bits_ -= 8;
        }
    }

    void finish() {
        if (bits_ > 0) {
            push(static_cast<uint8_t>(acc_ & 0xFF));
            acc_ = 0;
            bits_ = 0;
        }
        flush_block();
        out_.push_back(0);  // block terminator
    }

private:
    void push(uint8_t b) {
        block_.push_back(b);
        if (block_.size() == 255) flush_block();
    }

    void flush_block() {
        if (block_.empty()) return;
        out_.push_back(static_cast<uint8_t>(block_.size()));
        out_.insert(out_.end(), block_.begin(), block_.end());
        block_.clear();
    }

    std::vector<uint8_t>& out_;
    std::vector<uint8_t>  block_;
    uint32_t acc_  = 0;
    int      bits_ = 0;
};

std::vector<uint8_t> to_indices(const ImageU8& img, bool& has_transparent)
{
    const int C = img.c();
    const std::size_t n = static_cast<std::size_t>(img.w()) * img.h();
    const uint8_t* px = img.data();

    std::vector<uint8_t> indices(n);
    has_transparent = false;

    for (std::size_t i = 0; i < n; ++i) {
        const uint8_t* p = px + i * C;
        if (C == 4 && p[3] < 128) {
            indices[i] = static_cast<uint8_t>(kTransparent);
            has_transparent = true;
            continue;
        }
        const int r = p[0];
        const int g = (C == 1) ? p[0] : p[1];
        const int b = (C == 1) ? p[0] : p[2];
        const int qr = quantize(r, kRedLevels);
        const int qg = quantize(g, kGreenLevels);
        const int qb = quantize(b, kBlueLevels);
        indices[i] = static_cast<uint8_t>((qr * kGreenLevels + qg) * kBlueLevels + qb);
    }
    return indices;
}

void write_lzw(std::vector<uint8_t>& out, const std::vector<uint8_t>& indices)
{
    const int clear_code = 1 << kMinCodeSize;
    const int eoi_code   = clear_code + 1;

    out.push_back(static_cast<uint8_t>(kMinCodeSize));
    BlockWriter bw(out);

    std::unordered_map<uint32_t, int> dict;
    int code_size = kMinCodeSize + 1;
    int next_code = eoi_code + 1;

    bw.write(clear_code, code_size);

    int prefix = indices[0];
    for (std::size_t i = 1; i < indices.size(); ++i) {
        const int k = indices[i];
        const uint32_t key = (static_cast<uint32_t>(prefix) << 8) | static_cast<uint32_t>(k);

        auto it = dict.find(key);
        if (it != dict.end()) {
            prefix = it->second;
            continue;
        }

        bw.write(prefix, code_size);

        dict.emplace(key, next_code);
        ++next_code;
        if (next_code - 1 >= (1 << code_size)) ++code_size;

        // 字典滿了 → clear 重來
        if (next_code - 1 == kMaxCode) {
            bw.write(clear_code, code_size);
            dict.clear();
            code_size = kMinCodeSize + 1;
            next_code = eoi_code + 1;
        }

        prefix = k;
    }

    bw.write(prefix, code_size);
    // 先 clear 讓解碼端回到最小 code size，EOI 的位寬才不會對不上
    bw.write(clear_code, code_size);
    bw.write(eoi_code, kMinCodeSize + 1);
    bw.finish();
}

} // namespace

std::vector<uint8_t> encode_gif(const ImageU8& image)
{
    if (image.empty()) throw Error(ErrorKind::EncodeFailure, "gif: empty image");
    if (image.w() > 0xFFFF || image.h() > 0xFFFF)
        throw Error(ErrorKind::EncodeFailure, "gif: image too large");

    bool has_transparent = false;
    const std::vector<uint8_t> indices = to_indices(image, has_transparent);

    std::vector<uint8_t> out;
    out.reserve(indices.size() / 2 + 1024);

    // header + logical screen descriptor
    const char* sig = "GIF89a";
    out.insert(out.end(), sig, sig + 6);
    put_u16(out, image.w());
    put_u16(out, image.h());
    out.push_back(0xF7);  // global color table, 8 bits/primary, 256 entries
    out.push_back(0);     // background
    out.push_back(0);     // aspect

    // global color table
    for (int i = 0; i < 256; ++i) {
        if (i < kCubeColors) {
            const int qb = i % kBlueLevels;
            const int qg = (i / kBlueLevels) % kGreenLevels;
            const int qr = i / (kBlueLevels * kGreenLevels);
            out.push_back(level_value(qr, kRedLevels));
            out.push_back(level_value(qg, kGreenLevels));
            out.push_back(level_value(qb, kBlueLevels));
        } else {
            out.push_back(0);
            out.push_back(0);
            out.push_back(0);
        }
    }

    // graphic control extension（只在有透明像素時）
    if (has_transparent) {
        out.push_back(0x21);
        out.push_back(0xF9);
        out.push_back(0x04);
        out.push_back(0x01);  // transparent color flag
        put_u16(out, 0);      // delay
        out.push_back(static_cast<uint8_t>(kTransparent));
        out.push_back(0x00);
    }

    // image descriptor
    out.push_back(0x2C);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, image.w());
    put_u16(out, image.h());
    out.push_back(0x00);

    write_lzw(out, indices);

    out.push_back(0x3B);  // trailer
    return out;
}

} // namespace detail
} // namespace imgmgr
