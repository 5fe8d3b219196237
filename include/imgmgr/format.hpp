#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace imgmgr {

// 可以解碼 / 編碼的點陣格式（SVG 不進 codec，直接略過轉換）
enum class ImageFormat {
    Gif,
    Jpeg,
    Png,
    Webp,
};

// "image/jpeg" 與 "image/jpg" 都算 JPEG
std::optional<ImageFormat> format_from_mime(std::string_view mime);

// "gif" / "jpg" / "jpeg" / "png" / "webp"，大小寫不拘
std::optional<ImageFormat> format_from_extension(std::string_view ext);

const char* mime_type(ImageFormat format);

// 預設副檔名（不含點）
const char* extension(ImageFormat format);

// 有沒有 per-pixel alpha / 透明色可以保留
bool supports_alpha(ImageFormat format);

// 只看檔頭 magic bytes 判斷 MIME；認得但不支援的（BMP、TIFF）也回傳
// 完全認不得 → 空字串
std::string sniff_mime(const unsigned char* data, std::size_t len);

} // namespace imgmgr
