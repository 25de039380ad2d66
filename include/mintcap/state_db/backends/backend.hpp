#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace mintcap::state_db::backends {

using object_visitor = std::function< void( const std::vector< std::byte >&, const std::vector< std::byte >& ) >;

class abstract_backend
{
public:
  abstract_backend();
  abstract_backend( std::uint64_t revision );
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  bool empty() const;

  virtual void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) = 0;
  virtual std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const = 0;
  virtual void remove( const std::vector< std::byte >& key )                                           = 0;
  virtual void clear()                                                                                 = 0;

  virtual std::uint64_t size() const = 0;

  /**
   * Visits every object in key order.
   */
  virtual void for_each( const object_visitor& visitor ) const = 0;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

private:
  std::uint64_t _revision = 0;
};

} // namespace mintcap::state_db::backends
