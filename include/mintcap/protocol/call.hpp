#pragma once

#include <cstdint>
#include <system_error>
#include <vector>

#include <mintcap/protocol/account.hpp>
#include <mintcap/protocol/event.hpp>

namespace mintcap::protocol {

struct call
{
  account caller{};
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::error_code code;
  std::vector< std::byte > stdout;
};

struct call_receipt
{
  account caller{};
  bool reverted = false;
  std::error_code code;
  std::vector< std::byte > stdout;
  std::vector< event > events;
  std::uint64_t revision = 0;
};

} // namespace mintcap::protocol
