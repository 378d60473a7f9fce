#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace rulegraph::util {

/*
  UUID helpers

  Row ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

} // namespace rulegraph::util
