#pragma once

#include <mintcap/state_db/backends/backend.hpp>
#include <mintcap/state_db/types.hpp>

#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

namespace mintcap::state_db {

/**
 * A state_delta holds the objects written on top of its parent. Reads fall
 * through to the parent unless the key was written or removed here.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;
  std::shared_ptr< backends::abstract_backend > _backend;
  std::set< std::vector< std::byte > > _removed_objects;
  bool _squashed = false;

public:
  state_delta() noexcept;
  state_delta( const std::shared_ptr< state_delta >& parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  void put( std::vector< std::byte >&& key, const ValueType& value );
  void remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Writes every change of this delta into its parent. The delta may not be
   * used afterwards.
   */
  void squash();
  void clear();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;
  bool squashed() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  const std::shared_ptr< state_delta >& parent() const;
  std::shared_ptr< state_delta > make_child();
};

template< std::ranges::range ValueType >
void state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  if( _squashed )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  _removed_objects.erase( key );
  _backend->put( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );
}

} // namespace mintcap::state_db
