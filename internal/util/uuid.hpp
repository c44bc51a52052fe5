#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace resolver::util {

/*
  Id generation.

  Mention (when upstream sends none), entity and run ids are RFC4122 v4
  UUIDs in canonical lower-case form. Ids are opaque everywhere else;
  nothing parses them back.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// ToString(GenerateUUID())
std::string NewId();

} // namespace resolver::util
