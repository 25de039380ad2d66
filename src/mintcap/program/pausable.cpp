#include <mintcap/memory.hpp>
#include <mintcap/program/objects.hpp>
#include <mintcap/program/pausable.hpp>

#include <utility>

namespace mintcap::program {

static constexpr auto paused_id = std::to_underlying( object_id::paused );

bool pausable::paused( system_interface* system ) const
{
  return system->get_object( paused_id, std::span< const std::byte >{} ).size() > 0;
}

std::error_code pausable::can_transfer( system_interface* system ) const
{
  if( paused( system ) )
    return program_errc::transfers_paused;

  return program_errc::ok;
}

std::error_code pausable::pause( system_interface* system ) const
{
  if( paused( system ) )
    return program_errc::transfers_paused;

  static constexpr std::uint8_t flag = 1;

  if( auto error = system->put_object( paused_id, std::span< const std::byte >{}, memory::as_bytes( flag ) ); error )
    return error;

  return system->event( "paused", memory::as_bytes( system->get_caller() ), { system->get_caller() } );
}

std::error_code pausable::unpause( system_interface* system ) const
{
  if( !paused( system ) )
    return program_errc::not_paused;

  if( auto error = system->remove_object( paused_id, std::span< const std::byte >{} ); error )
    return error;

  return system->event( "unpaused", memory::as_bytes( system->get_caller() ), { system->get_caller() } );
}

} // namespace mintcap::program
