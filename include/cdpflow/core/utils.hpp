#pragma once

#include <string>
#include <string_view>

#include "cdpflow/core/error.hpp"

namespace cdpflow::utils {

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto base64_encode(std::string_view data) -> std::string;

/// Decode standard (RFC 4648) base64. Whitespace and padding are skipped;
/// any other character outside the alphabet is a SerializationError.
auto base64_decode(std::string_view data) -> Result<std::string>;

} // namespace cdpflow::utils
