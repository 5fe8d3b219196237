#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "imgmgr/format.hpp"
#include "imgmgr/image.hpp"

namespace imgmgr {

// 不解碼就能拿到的資訊
struct ImageInfo {
    std::string mime;   // 例如 "image/png"、"image/bmp"
    int width  = 0;     // 不支援的格式可能是 0
    int height = 0;
};

// 格式編解碼介面；失敗一律丟 imgmgr::Error
//   decode → ErrorKind::DecodeFailure
//   encode → ErrorKind::EncodeFailure
class Codec {
public:
    virtual ~Codec() = default;

    // 認不得的資料 → std::nullopt
    virtual std::optional<ImageInfo> probe(const Bytes& bytes) const = 0;

    // 輸出 3 通道，來源帶 alpha 時 4 通道
    virtual ImageU8 decode(const Bytes& bytes, ImageFormat format) const = 0;

    // quality：0..100；PNG 換算成壓縮等級，GIF 忽略
    virtual Bytes encode(const ImageU8& image, ImageFormat format, int quality) const = 0;
};

// stb_image / stb_image_write / libwebp + 內建 GIF writer
std::shared_ptr<Codec> make_default_codec();

} // namespace imgmgr
