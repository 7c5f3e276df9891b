#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace voicecode::util {

/*
  UUID helpers

  Request ids and session ids are RFC4122 version 4 UUIDs rendered in
  lowercase canonical form (8-4-4-4-12).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts either case, with or without dashes. Throws std::invalid_argument.
UUID FromString(const std::string& str);

// Lowercase canonical rendering of `str`. Throws std::invalid_argument.
std::string Canonicalize(const std::string& str);

// Convenience: GenerateUUID() rendered with ToString().
std::string GenerateUUIDString();

} // namespace voicecode::util
