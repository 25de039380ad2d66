#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace mintcap::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

constexpr std::size_t program_address_size = 32;

/**
 * Prefix of every object key: the owning program followed by the object
 * type. The layout has no padding so the raw bytes can be used as a key.
 */
struct object_space
{
  std::array< std::byte, program_address_size > program{};
  std::uint32_t id = 0;
};

static_assert( sizeof( object_space ) == program_address_size + sizeof( std::uint32_t ) );

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;
using genesis_init_function    = std::function< void( state_node_ptr& ) >;

} // namespace mintcap::state_db
