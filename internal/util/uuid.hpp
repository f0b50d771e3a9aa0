#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace taskpilot::util {

/*
  Task and occurrence ids are RFC4122 version 4 UUIDs in canonical text
  form (8-4-4-4-12 lowercase hex).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

} // namespace taskpilot::util
