#pragma once

#include <cstdint>
#include <string>

#include <mintcap/protocol.hpp>
#include <mintcap/state_db.hpp>

namespace mintcap::controller { namespace state {

/**
 * Account under which the token program keeps its objects and emits its
 * events.
 */
const protocol::account& token_program();

struct genesis_data
{
  protocol::account deployer{};
  std::string name;
  std::string symbol;
  std::uint64_t max_supply = 0;
};

}} // namespace mintcap::controller::state
