#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "imgmgr/image.hpp"

namespace imgmgr {
namespace detail {

// 只讀 header；失敗回傳 false
bool webp_info(const uint8_t* data, std::size_t size, int& w, int& h);

// 有 alpha → RGBA，否則 RGB
ImageU8 decode_webp(const uint8_t* data, std::size_t size);

std::vector<uint8_t> encode_webp(const ImageU8& image, int quality);

} // namespace detail
} // namespace imgmgr
