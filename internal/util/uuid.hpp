#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace staging::util {

/*
  UUID helpers

  Definition identities are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewIdentity() {
  return ToString(GenerateUUID());
}

} // namespace staging::util
