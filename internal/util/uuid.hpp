#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace stowage::util {

/*
  UUID helpers

  Used for lock tokens and store-issued session ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical textual form of a fresh random UUID.
std::string NewToken();

} // namespace stowage::util
