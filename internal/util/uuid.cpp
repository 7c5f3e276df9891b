#include "uuid.hpp"

#include <random>
#include <stdexcept>

namespace voicecode::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool IsDashPosition(std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    auto word = rng();
    for (std::size_t j = 0; j < 8; ++j, word >>= 8) id[i + j] = static_cast<uint8_t>(word & 0xFF);
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  const bool dashed = str.size() == 36;
  if (!dashed && str.size() != 32) {
    throw std::invalid_argument("invalid uuid '" + str + "': expected 32 hex digits");
  }

  UUID        id{};
  std::size_t nibble = 0;
  for (std::size_t i = 0; i < str.size(); ++i) {
    if (dashed && IsDashPosition(i)) {
      if (str[i] != '-') throw std::invalid_argument("invalid uuid '" + str + "': misplaced dash");
      continue;
    }

    const int value = HexValue(str[i]);
    if (value < 0) throw std::invalid_argument("invalid uuid '" + str + "': non-hex character");

    auto& byte = id[nibble / 2];
    byte       = static_cast<uint8_t>(nibble % 2 == 0 ? value << 4 : byte | value);
    ++nibble;
  }

  return id;
}

std::string Canonicalize(const std::string& str) {
  return ToString(FromString(str));
}

std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace voicecode::util
