#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace imgmgr {

// 編碼後的檔案內容
using Bytes = std::vector<uint8_t>;

// 像素緩衝區：row-major、交錯通道（1 = 灰階、3 = RGB、4 = RGBA）
class ImageU8 {
public:
    ImageU8() = default;

    // 擁有新配置（自有）的影像，內容清為 0（黑色 / 全透明）
    ImageU8(int h, int w, int c)
        : h_(h), w_(w), c_(c)
    {
        if (h <= 0 || w <= 0 || !valid_channels(c))
            throw std::invalid_argument("ImageU8: invalid shape");
        data_ = std::shared_ptr<uint8_t[]>(new uint8_t[byte_size()](), std::default_delete<uint8_t[]>());
    }

    // 共享外部緩衝區（零拷貝），例如 stb / libwebp 配置的像素
    ImageU8(int h, int w, int c, std::shared_ptr<uint8_t[]> external)
        : h_(h), w_(w), c_(c), data_(std::move(external))
    {
        if (!data_) throw std::invalid_argument("ImageU8: null external buffer");
        if (h <= 0 || w <= 0 || !valid_channels(c))
            throw std::invalid_argument("ImageU8: invalid shape");
    }

    // 不允許複製（避免意外深拷）
    ImageU8(const ImageU8&)            = delete;
    ImageU8& operator=(const ImageU8&) = delete;

    ImageU8(ImageU8&&)            = default;
    ImageU8& operator=(ImageU8&&) = default;

    int  h() const { return h_; }
    int  w() const { return w_; }
    int  c() const { return c_; }
    bool empty() const { return !data_; }
    bool has_alpha() const { return c_ == 4; }

    std::size_t byte_size() const {
        return static_cast<std::size_t>(h_) * w_ * c_;
    }

    uint8_t*       data()       { return data_.get(); }
    const uint8_t* data() const { return data_.get(); }

    const std::shared_ptr<uint8_t[]>& shared() const { return data_; }

    static bool valid_channels(int c) { return c == 1 || c == 3 || c == 4; }

private:
    int h_ = 0, w_ = 0, c_ = 1;
    std::shared_ptr<uint8_t[]> data_;
};

} // namespace imgmgr
