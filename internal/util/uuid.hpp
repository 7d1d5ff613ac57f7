#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace timekeeper::util {

/*
  UUID helpers

  Match identifiers are random RFC4122 version 4 UUIDs rendered in the
  canonical lowercase 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace timekeeper::util
