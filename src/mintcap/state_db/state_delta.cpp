#include <mintcap/state_db/backends/map/map_backend.hpp>
#include <mintcap/state_db/state_delta.hpp>

namespace mintcap::state_db {

state_delta::state_delta() noexcept:
    _backend( std::make_shared< backends::map::map_backend >() )
{}

state_delta::state_delta( const std::shared_ptr< state_delta >& parent ) noexcept:
    _parent( parent ),
    _backend( std::make_shared< backends::map::map_backend >( parent->revision() ) )
{}

void state_delta::remove( std::vector< std::byte >&& key )
{
  if( _squashed )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  if( !get( key ) )
    return;

  _backend->remove( key );

  if( !root() )
    _removed_objects.insert( std::move( key ) );
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  if( auto value = _backend->get( key ); value )
    return value;

  if( removed( key ) )
    return {};

  if( _parent )
    return _parent->get( key );

  return {};
}

void state_delta::squash()
{
  if( _squashed )
    throw std::runtime_error( "state delta has already been squashed" );

  if( root() )
    throw std::runtime_error( "cannot squash the root state delta" );

  for( const auto& key: _removed_objects )
    _parent->remove( std::vector< std::byte >( key ) );

  _backend->for_each(
    [ & ]( const std::vector< std::byte >& key, const std::vector< std::byte >& value )
    {
      _parent->put( std::vector< std::byte >( key ), value );
    } );

  _parent->set_revision( _parent->revision() + 1 );

  clear();
  _squashed = true;
}

void state_delta::clear()
{
  _backend->clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

bool state_delta::squashed() const
{
  return _squashed;
}

std::uint64_t state_delta::revision() const
{
  return _backend->revision();
}

void state_delta::set_revision( std::uint64_t revision )
{
  _backend->set_revision( revision );
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  return std::make_shared< state_delta >( shared_from_this() );
}

} // namespace mintcap::state_db
