#include "otto/common/crypto.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace otto::common {

namespace {

template <typename Bytes> std::string to_hex(const Bytes &bytes) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char byte : bytes) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());
  return to_hex(data);
}

std::string generate_uuid() {
  std::array<unsigned char, 16> data{};
  fill_random(data.data(), data.size());
  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);

  const std::string hex = to_hex(data);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string sha256_hex(const std::string &text) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest.data());
  return to_hex(digest);
}

} // namespace otto::common
