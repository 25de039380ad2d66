#pragma once

#include <mintcap/state_db/backends/backend.hpp>

#include <map>

namespace mintcap::state_db::backends::map {

class map_backend final: public abstract_backend
{
public:
  map_backend();
  map_backend( const map_backend& )            = default;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = default;
  map_backend& operator=( map_backend&& )      = delete;
  map_backend( std::uint64_t revision );
  ~map_backend() final;

  void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const final;
  void remove( const std::vector< std::byte >& key ) final;
  void clear() noexcept final;

  std::uint64_t size() const noexcept final;

  void for_each( const object_visitor& visitor ) const final;

private:
  std::map< std::vector< std::byte >, std::vector< std::byte > > _map;
};

} // namespace mintcap::state_db::backends::map
