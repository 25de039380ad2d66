#include <mintcap/state_db/database.hpp>

namespace mintcap::state_db {

database::database() noexcept {}

database::~database()
{
  close();
}

std::error_code database::open( genesis_init_function init )
{
  if( _root )
    return state_db_errc::already_open;

  auto root           = std::make_shared< permanent_state_node >( std::make_shared< state_delta >() );
  state_node_ptr node = root;

  if( init )
    init( node );

  _root = root;
  return state_db_errc::ok;
}

void database::close()
{
  _root.reset();
}

bool database::is_open() const
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::root() const
{
  return _root;
}

} // namespace mintcap::state_db
