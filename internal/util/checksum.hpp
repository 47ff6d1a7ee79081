#pragma once

#include <cstdint>
#include <string_view>

namespace accessres::util {

// CRC-32 (IEEE 802.3): poly 0xEDB88320 reflected, init 0xFFFFFFFF, final xor 0xFFFFFFFF.
std::uint32_t Crc32(std::string_view bytes);

} // namespace accessres::util
