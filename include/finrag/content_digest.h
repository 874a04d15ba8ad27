#pragma once

#include <string>
#include <string_view>

namespace finrag {

// Lowercase hex SHA-256 of `content`.
std::string ContentDigest(std::string_view content);

} // namespace finrag
