#include "checksum.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace accessres::util {

std::uint32_t Crc32(std::string_view bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);

  const auto* data      = reinterpret_cast<const Bytef*>(bytes.data());
  std::size_t remaining = bytes.size();
  while (remaining > 0) {
    // zlib takes a uInt length; feed oversized buffers in slices.
    const auto chunk = static_cast<uInt>(std::min<std::size_t>(remaining, std::numeric_limits<uInt>::max()));
    crc              = crc32(crc, data, chunk);
    data += chunk;
    remaining -= chunk;
  }

  return static_cast<std::uint32_t>(crc);
}

} // namespace accessres::util
