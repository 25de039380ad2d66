#include <mintcap/state_db/state_delta.hpp>
#include <mintcap/state_db/state_node.hpp>

namespace mintcap::state_db {

temporary_state_node::temporary_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::shared_ptr< state_delta > temporary_state_node::mutable_delta()
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return _delta;
}

const std::shared_ptr< state_delta >& temporary_state_node::delta() const
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return _delta;
}

std::error_code temporary_state_node::squash()
{
  if( !_delta )
    return state_db_errc::already_squashed;

  _delta->squash();
  _delta.reset();
  return state_db_errc::ok;
}

} // namespace mintcap::state_db
