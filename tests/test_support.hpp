#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include "imgmgr/codec.hpp"
#include "imgmgr/image.hpp"

namespace imgmgr::test {

// 每個測試一個暫存目錄，結束時整個刪掉
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream ss;
        ss << "imgmgr-test-" << std::hex << rd() << rd();
        path_ = std::filesystem::temp_directory_path() / ss.str();
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// 每個像素都不一樣的測試圖
inline ImageU8 make_gradient(int w, int h, int c) {
    ImageU8 img(h, w, c);
    uint8_t* p = img.data();
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            for (int k = 0; k < c; ++k) {
                const int v = (k == 3) ? 255 : (x * 7 + y * 13 + k * 60) % 256;
                p[(static_cast<std::size_t>(y) * w + x) * c + k] = static_cast<uint8_t>(v);
            }
        }
    }
    return img;
}

// 1 通道，值由呼叫端指定（row-major）
inline ImageU8 make_gray(int w, int h, std::initializer_list<uint8_t> values) {
    if (values.size() != static_cast<std::size_t>(w) * h)
        throw std::invalid_argument("make_gray: size mismatch");
    ImageU8 img(h, w, 1);
    std::size_t i = 0;
    for (uint8_t v : values) img.data()[i++] = v;
    return img;
}

inline uint8_t at(const ImageU8& img, int x, int y, int c = 0) {
    return img.data()[(static_cast<std::size_t>(y) * img.w() + x) * img.c() + c];
}

inline Bytes encode(const ImageU8& img, ImageFormat format, int quality = 90) {
    return make_default_codec()->encode(img, format, quality);
}

inline ImageU8 decode_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto codec = make_default_codec();
    auto info = codec->probe(bytes);
    if (!info) throw std::runtime_error("decode_file: unknown format " + path.string());
    auto format = format_from_mime(info->mime);
    if (!format) throw std::runtime_error("decode_file: unsupported " + info->mime);
    return codec->decode(bytes, *format);
}

inline Bytes read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const Bytes& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

// 24-bit 無壓縮 BMP（bottom-up，每列補到 4 bytes）
inline Bytes make_bmp(int w, int h) {
    const int row = (w * 3 + 3) & ~3;
    const uint32_t pixels = static_cast<uint32_t>(row * h);
    const uint32_t file_size = 54 + pixels;

    Bytes b;
    auto u16 = [&](uint32_t v) { b.push_back(v & 0xFF); b.push_back((v >> 8) & 0xFF); };
    auto u32 = [&](uint32_t v) { u16(v & 0xFFFF); u16(v >> 16); };

    b.push_back('B'); b.push_back('M');
    u32(file_size); u32(0); u32(54);
    u32(40); u32(static_cast<uint32_t>(w)); u32(static_cast<uint32_t>(h));
    u16(1); u16(24); u32(0); u32(pixels);
    u32(2835); u32(2835); u32(0); u32(0);
    b.resize(file_size, 0x80);
    return b;
}

// 在 SOI 後面插入只含 Orientation 的 APP1 / Exif 區段
inline Bytes with_exif_orientation(const Bytes& jpeg, int tag, bool big_endian = false) {
    Bytes tiff;
    auto u16 = [&](uint32_t v) {
        if (big_endian) { tiff.push_back((v >> 8) & 0xFF); tiff.push_back(v & 0xFF); }
        else            { tiff.push_back(v & 0xFF); tiff.push_back((v >> 8) & 0xFF); }
    };
    auto u32 = [&](uint32_t v) {
        if (big_endian) { u16(v >> 16); u16(v & 0xFFFF); }
        else            { u16(v & 0xFFFF); u16(v >> 16); }
    };

    tiff.push_back(big_endian ? 'M' : 'I');
    tiff.push_back(big_endian ? 'M' : 'I');
    u16(0x2A);
    u32(8);                  // IFD0 offset
    u16(1);                  // entry count
    u16(0x0112); u16(3); u32(1);
    u16(static_cast<uint32_t>(tag)); u16(0);
    u32(0);                  // next IFD

    const std::size_t seg_len = 2 + 6 + tiff.size();

    Bytes out;
    out.insert(out.end(), jpeg.begin(), jpeg.begin() + 2);  // SOI
    out.push_back(0xFF); out.push_back(0xE1);
    out.push_back(static_cast<uint8_t>(seg_len >> 8));
    out.push_back(static_cast<uint8_t>(seg_len & 0xFF));
    const char exif[6] = {'E', 'x', 'i', 'f', 0, 0};
    out.insert(out.end(), exif, exif + 6);
    out.insert(out.end(), tiff.begin(), tiff.end());
    out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
    return out;
}

} // namespace imgmgr::test
