#include <mintcap/memory.hpp>
#include <mintcap/program/objects.hpp>
#include <mintcap/program/ownable.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace mintcap::program {

static constexpr auto owner_id = std::to_underlying( object_id::owner );

protocol::account ownable::owner( system_interface* system ) const
{
  protocol::account a{};
  auto object = system->get_object( owner_id, std::span< const std::byte >{} );

  if( object.size() == a.size() )
    std::ranges::copy( object, a.begin() );

  return a;
}

std::error_code ownable::authorize( system_interface* system, const protocol::account& caller ) const
{
  auto current = owner( system );

  if( current.null() || current != caller )
    return program_errc::unauthorized;

  return program_errc::ok;
}

std::error_code ownable::initialize( system_interface* system, const protocol::account& owner ) const
{
  if( owner.null() )
    return program_errc::invalid_owner;

  return set_owner( system, owner );
}

std::error_code ownable::transfer_ownership( system_interface* system, const protocol::account& new_owner ) const
{
  if( new_owner.null() )
    return program_errc::invalid_owner;

  return set_owner( system, new_owner );
}

std::error_code ownable::renounce_ownership( system_interface* system ) const
{
  return set_owner( system, protocol::null_account );
}

std::error_code ownable::set_owner( system_interface* system, const protocol::account& new_owner ) const
{
  auto previous_owner = owner( system );

  if( auto error = system->put_object( owner_id, std::span< const std::byte >{}, memory::as_bytes( new_owner ) );
      error )
    return error;

  std::vector< std::byte > data;
  data.reserve( previous_owner.size() + new_owner.size() );
  std::ranges::copy( previous_owner, std::back_inserter( data ) );
  std::ranges::copy( new_owner, std::back_inserter( data ) );

  return system->event( "ownership_transferred", data, { previous_owner, new_owner } );
}

} // namespace mintcap::program
