#pragma once

#include <cstdint>
#include <vector>

#include "imgmgr/image.hpp"

namespace imgmgr {
namespace detail {

// GIF89a 單張影像編碼
// 調色盤固定為 6x7x6 色立方（252 色），alpha < 128 的像素用第 252 號透明色
std::vector<uint8_t> encode_gif(const ImageU8& image);

} // namespace detail
} // namespace imgmgr
