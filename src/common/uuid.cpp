#include "clawlink/common/uuid.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <random>
#include <vector>

namespace clawlink::common {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void fill_random(std::uint8_t *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  std::random_device rd;
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<std::uint8_t>(rd() & 0xFFu);
  }
}

void append_hex(std::string &out, const std::uint8_t byte) {
  out.push_back(kHexDigits[(byte >> 4u) & 0x0Fu]);
  out.push_back(kHexDigits[byte & 0x0Fu]);
}

} // namespace

std::string generate_uuid() {
  std::array<std::uint8_t, 16> bytes{};
  fill_random(bytes.data(), bytes.size());
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u);

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    append_hex(out, bytes[i]);
  }
  return out;
}

std::string random_hex(const std::size_t bytes) {
  std::vector<std::uint8_t> buffer(bytes);
  if (!buffer.empty()) {
    fill_random(buffer.data(), buffer.size());
  }
  std::string out;
  out.reserve(bytes * 2);
  for (const auto byte : buffer) {
    append_hex(out, byte);
  }
  return out;
}

} // namespace clawlink::common
