#pragma once

#include <cstddef>
#include <string>

namespace otto::common {

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// RFC 4122 version 4 identifier, lower-case hex with dashes.
[[nodiscard]] std::string generate_uuid();

[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace otto::common
