#include "uuid.hpp"

#include <cctype>
#include <random>

namespace launcher::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool IsHyphenPosition(size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    uint64_t bits = rng();
    for (size_t j = 0; j < 8; ++j, bits >>= 8) {
      id[i + j] = static_cast<uint8_t>(bits & 0xFF);
    }
  }

  // version 4, RFC4122 variant
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  std::string text;
  text.reserve(36);

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      text.push_back('-');
    }
    text.push_back(kHexDigits[id[i] >> 4]);
    text.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return text;
}

bool IsCanonicalUUID(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (size_t pos = 0; pos < text.size(); ++pos) {
    const bool ok = IsHyphenPosition(pos) ? text[pos] == '-' : std::isxdigit(static_cast<unsigned char>(text[pos])) != 0;
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string NewCorrelationId() {
  return ToString(GenerateUUID());
}

} // namespace launcher::util
