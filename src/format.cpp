#include "imgmgr/format.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace imgmgr {

static std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

std::optional<ImageFormat> format_from_mime(std::string_view mime)
{
    const std::string m = lower(mime);
    if (m == "image/gif")                        return ImageFormat::Gif;
    if (m == "image/jpeg" || m == "image/jpg")   return ImageFormat::Jpeg;
    if (m == "image/png")                        return ImageFormat::Png;
    if (m == "image/webp")                       return ImageFormat::Webp;
    return std::nullopt;
}

std::optional<ImageFormat> format_from_extension(std::string_view ext)
{
    const std::string e = lower(ext);
    if (e == "gif")                 return ImageFormat::Gif;
    if (e == "jpg" || e == "jpeg")  return ImageFormat::Jpeg;
    if (e == "png")                 return ImageFormat::Png;
    if (e == "webp")                return ImageFormat::Webp;
    return std::nullopt;
}

const char* mime_type(ImageFormat format)
{
    switch (format) {
    case ImageFormat::Gif:  return "image/gif";
    case ImageFormat::Jpeg: return "image/jpeg";
    case ImageFormat::Png:  return "image/png";
    case ImageFormat::Webp: return "image/webp";
    }
    return "application/octet-stream";
}

const char* extension(ImageFormat format)
{
    switch (format) {
    case ImageFormat::Gif:  return "gif";
    case ImageFormat::Jpeg: return "jpg";
    case ImageFormat::Png:  return "png";
    case ImageFormat::Webp: return "webp";
    }
    return "";
}

bool supports_alpha(ImageFormat format)
{
    return format != ImageFormat::Jpeg;
}

std::string sniff_mime(const unsigned char* d, std::size_t n)
{
    if (!d) return {};

    if (n >= 3 && d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF)
        return "image/jpeg";

    static const unsigned char png_sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (n >= 8 && std::memcmp(d, png_sig, 8) == 0)
        return "image/png";

    if (n >= 6 && (std::memcmp(d, "GIF87a", 6) == 0 || std::memcmp(d, "GIF89a", 6) == 0))
        return "image/gif";

    // RIFF....WEBP
    if (n >= 12 && std::memcmp(d, "RIFF", 4) == 0 && std::memcmp(d + 8, "WEBP", 4) == 0)
        return "image/webp";

    if (n >= 2 && d[0] == 'B' && d[1] == 'M')
        return "image/bmp";

    if (n >= 4 && ((d[0] == 'I' && d[1] == 'I' && d[2] == 0x2A && d[3] == 0x00) ||
                   (d[0] == 'M' && d[1] == 'M' && d[2] == 0x00 && d[3] == 0x2A)))
        return "image/tiff";

    return {};
}

} // namespace imgmgr
