#include <mintcap/memory.hpp>
#include <mintcap/program/ledger.hpp>
#include <mintcap/program/objects.hpp>

#include <boost/endian.hpp>

#include <algorithm>
#include <cassert>
#include <iterator>
#include <limits>
#include <utility>

namespace mintcap::program {

static constexpr auto supply_id  = std::to_underlying( object_id::supply );
static constexpr auto balance_id = std::to_underlying( object_id::balance );

static std::uint64_t read_amount( std::span< const std::byte > object )
{
  if( !object.size() )
    return 0;

  assert( object.size() == sizeof( std::uint64_t ) );

  auto amount = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( amount );
  return amount;
}

std::uint64_t ledger::total_supply( system_interface* system ) const
{
  return read_amount( system->get_object( supply_id, std::span< const std::byte >{} ) );
}

std::uint64_t ledger::balance_of( system_interface* system, const protocol::account& account ) const
{
  return read_amount( system->get_object( balance_id, account ) );
}

std::error_code ledger::transfer( system_interface* system,
                                  const protocol::account& from,
                                  const protocol::account& to,
                                  std::uint64_t value ) const
{
  if( to.null() )
    return program_errc::invalid_recipient;

  auto from_balance = balance_of( system, from );

  if( from_balance < value )
    return program_errc::insufficient_balance;

  from_balance -= value;
  boost::endian::native_to_little_inplace( from_balance );

  if( auto error = system->put_object( balance_id, from, memory::as_bytes( from_balance ) ); error )
    return error;

  // Read after the debit so a transfer to self nets to zero.
  auto to_balance = balance_of( system, to );

  if( std::numeric_limits< std::uint64_t >::max() - value < to_balance )
    return program_errc::overflow;

  to_balance += value;
  boost::endian::native_to_little_inplace( to_balance );

  if( auto error = system->put_object( balance_id, to, memory::as_bytes( to_balance ) ); error )
    return error;

  return emit_transfer( system, from, to, value );
}

std::error_code ledger::mint( system_interface* system, const protocol::account& to, std::uint64_t value ) const
{
  if( to.null() )
    return program_errc::invalid_recipient;

  auto supply     = total_supply( system );
  auto to_balance = balance_of( system, to );

  if( std::numeric_limits< std::uint64_t >::max() - value < supply )
    return program_errc::overflow;

  supply     += value;
  to_balance += value;

  boost::endian::native_to_little_inplace( supply );
  boost::endian::native_to_little_inplace( to_balance );

  if( auto error = system->put_object( supply_id, std::span< const std::byte >{}, memory::as_bytes( supply ) ); error )
    return error;

  if( auto error = system->put_object( balance_id, to, memory::as_bytes( to_balance ) ); error )
    return error;

  return emit_transfer( system, protocol::null_account, to, value );
}

std::error_code ledger::emit_transfer( system_interface* system,
                                       const protocol::account& from,
                                       const protocol::account& to,
                                       std::uint64_t value ) const
{
  std::vector< std::byte > data;
  data.reserve( from.size() + to.size() + sizeof( value ) );

  boost::endian::native_to_little_inplace( value );
  std::ranges::copy( from, std::back_inserter( data ) );
  std::ranges::copy( to, std::back_inserter( data ) );
  std::ranges::copy( memory::as_bytes( value ), std::back_inserter( data ) );

  return system->event( "transfer", data, { from, to } );
}

} // namespace mintcap::program
