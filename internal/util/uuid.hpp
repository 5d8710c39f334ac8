#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace recsync::util {

/*
  Random RFC4122 v4 UUIDs, used for multipart upload session ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace recsync::util
