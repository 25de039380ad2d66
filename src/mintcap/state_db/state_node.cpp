#include <mintcap/state_db/state_delta.hpp>
#include <mintcap/state_db/state_node.hpp>

namespace mintcap::state_db {

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return delta()->get( make_compound_key( space, key ) );
}

void state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  mutable_delta()->remove( make_compound_key( space, key ) );
}

std::shared_ptr< temporary_state_node > state_node::make_child()
{
  return std::make_shared< temporary_state_node >( mutable_delta()->make_child() );
}

std::uint64_t state_node::revision() const
{
  return delta()->revision();
}

} // namespace mintcap::state_db
