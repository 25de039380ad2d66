#include <mintcap/state_db/backends/map/map_backend.hpp>

#include <utility>

namespace mintcap::state_db::backends::map {

map_backend::map_backend():
    abstract_backend()
{}

map_backend::map_backend( std::uint64_t revision ):
    abstract_backend( revision )
{}

map_backend::~map_backend() {}

void map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  auto itr = _map.lower_bound( key );

  if( itr != _map.end() && !_map.key_comp()( key, itr->first ) )
    itr->second = std::move( value );
  else
    _map.emplace_hint( itr, std::move( key ), std::move( value ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::remove( const std::vector< std::byte >& key )
{
  _map.erase( key );
}

void map_backend::clear() noexcept
{
  _map.clear();
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

void map_backend::for_each( const object_visitor& visitor ) const
{
  for( const auto& [ key, value ]: _map )
    visitor( key, value );
}

} // namespace mintcap::state_db::backends::map
