#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace accessres::util {

std::string                Base64Encode(std::string_view bytes);
std::optional<std::string> Base64Decode(std::string_view text);

} // namespace accessres::util
