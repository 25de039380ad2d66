#pragma once

#include <cstdint>

namespace mintcap::program {

// Object ids within the token's object space. Stored integers are little endian.
enum class object_id : std::uint32_t // NOLINT(performance-enum-size)
{
  name,
  symbol,
  max_supply,
  supply,
  balance,
  owner,
  paused
};

} // namespace mintcap::program
