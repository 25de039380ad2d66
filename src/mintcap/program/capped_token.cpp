#include <mintcap/memory.hpp>
#include <mintcap/program/capped_token.hpp>
#include <mintcap/program/objects.hpp>
#include <mintcap/protocol.hpp>

#include <boost/endian.hpp>

#include <concepts>
#include <limits>
#include <utility>

namespace mintcap::program {

static constexpr auto name_id       = std::to_underlying( object_id::name );
static constexpr auto symbol_id     = std::to_underlying( object_id::symbol );
static constexpr auto max_supply_id = std::to_underlying( object_id::max_supply );

template< std::integral T >
static std::error_code read_integer( system_interface* system, T& value )
{
  if( system->read( file_descriptor::stdin, memory::as_writable_bytes( value ) ) )
    return program_errc::invalid_argument;

  boost::endian::little_to_native_inplace( value );
  return program_errc::ok;
}

static std::error_code read_account( system_interface* system, protocol::account& account )
{
  if( system->read( file_descriptor::stdin, memory::as_writable_bytes( account.data(), account.size() ) ) )
    return program_errc::invalid_argument;

  return program_errc::ok;
}

static std::error_code read_string( system_interface* system, std::string& str, std::uint32_t limit )
{
  std::uint32_t length = 0;
  if( auto error = read_integer( system, length ); error )
    return error;

  if( length > limit )
    return program_errc::invalid_argument;

  str.resize( length );
  if( system->read( file_descriptor::stdin, memory::as_writable_bytes( str.data(), str.size() ) ) )
    return program_errc::invalid_argument;

  return program_errc::ok;
}

template< std::integral T >
static std::error_code write_integer( system_interface* system, T value )
{
  boost::endian::native_to_little_inplace( value );
  return system->write( file_descriptor::stdout, memory::as_bytes( value ) );
}

std::error_code capped_token::run( system_interface* system )
{
  std::uint32_t code = 0;
  if( auto error = read_integer( system, code ); error )
    return error;

  if( code == std::to_underlying( instruction::construct ) )
    return construct( system );

  if( code > std::to_underlying( instruction::renounce_ownership ) )
    return program_errc::invalid_instruction;

  if( !initialized( system ) )
    return program_errc::uninitialized;

  switch( static_cast< instruction >( code ) )
  {
    case instruction::name:
      return system->write( file_descriptor::stdout, system->get_object( name_id, std::span< const std::byte >{} ) );
    case instruction::symbol:
      return system->write( file_descriptor::stdout, system->get_object( symbol_id, std::span< const std::byte >{} ) );
    case instruction::decimals:
      return write_integer( system, decimals );
    case instruction::total_supply:
      return write_integer( system, _ledger.total_supply( system ) );
    case instruction::max_supply:
      return write_integer( system, max_supply( system ) );
    case instruction::balance_of:
      {
        protocol::account account;
        if( auto error = read_account( system, account ); error )
          return error;

        return write_integer( system, _ledger.balance_of( system, account ) );
      }
    case instruction::owner:
      return system->write( file_descriptor::stdout, memory::as_bytes( _ownable.owner( system ) ) );
    case instruction::paused:
      return write_integer( system, static_cast< std::uint8_t >( _gate.paused( system ) ) );
    case instruction::transfer:
      return transfer( system );
    case instruction::mint:
      return mint( system );
    case instruction::multisend:
      return multisend( system );
    case instruction::pause:
      {
        if( auto error = _ownable.authorize( system, system->get_caller() ); error )
          return error;

        return _gate.pause( system );
      }
    case instruction::unpause:
      {
        if( auto error = _ownable.authorize( system, system->get_caller() ); error )
          return error;

        return _gate.unpause( system );
      }
    case instruction::transfer_ownership:
      {
        protocol::account new_owner;
        if( auto error = read_account( system, new_owner ); error )
          return error;

        if( auto error = _ownable.authorize( system, system->get_caller() ); error )
          return error;

        return _ownable.transfer_ownership( system, new_owner );
      }
    case instruction::renounce_ownership:
      {
        if( auto error = _ownable.authorize( system, system->get_caller() ); error )
          return error;

        return _ownable.renounce_ownership( system );
      }
    case instruction::construct:
      return construct( system );
  }

  std::unreachable();
}

std::error_code capped_token::construct( system_interface* system )
{
  std::string token_name, token_symbol;
  std::uint64_t ceiling = 0;

  if( auto error = read_string( system, token_name, max_metadata_length ); error )
    return error;

  if( auto error = read_string( system, token_symbol, max_metadata_length ); error )
    return error;

  if( auto error = read_integer( system, ceiling ); error )
    return error;

  if( initialized( system ) )
    return program_errc::already_initialized;

  if( !ceiling || token_name.empty() || token_symbol.empty() )
    return program_errc::invalid_configuration;

  if( auto error = system->put_object( name_id, std::span< const std::byte >{}, memory::as_bytes( token_name ) ); error )
    return error;

  if( auto error = system->put_object( symbol_id, std::span< const std::byte >{}, memory::as_bytes( token_symbol ) );
      error )
    return error;

  boost::endian::native_to_little_inplace( ceiling );

  if( auto error = system->put_object( max_supply_id, std::span< const std::byte >{}, memory::as_bytes( ceiling ) );
      error )
    return error;

  return _ownable.initialize( system, system->get_caller() );
}

std::error_code capped_token::mint( system_interface* system )
{
  protocol::account to;
  std::uint64_t value = 0;

  if( auto error = read_account( system, to ); error )
    return error;

  if( auto error = read_integer( system, value ); error )
    return error;

  if( auto error = _ownable.authorize( system, system->get_caller() ); error )
    return error;

  auto supply  = _ledger.total_supply( system );
  auto ceiling = max_supply( system );

  if( supply > ceiling || value > ceiling - supply )
    return program_errc::supply_exceeded;

  return _ledger.mint( system, to, value );
}

std::error_code capped_token::multisend( system_interface* system )
{
  std::uint32_t recipient_count = 0;
  if( auto error = read_integer( system, recipient_count ); error )
    return error;

  if( recipient_count > max_batch_size )
    return program_errc::invalid_argument;

  std::vector< protocol::account > recipients( recipient_count );
  for( auto& recipient: recipients )
    if( auto error = read_account( system, recipient ); error )
      return error;

  std::uint32_t amount_count = 0;
  if( auto error = read_integer( system, amount_count ); error )
    return error;

  if( amount_count > max_batch_size )
    return program_errc::invalid_argument;

  std::vector< std::uint64_t > amounts( amount_count );
  for( auto& amount: amounts )
    if( auto error = read_integer( system, amount ); error )
      return error;

  if( recipients.size() != amounts.size() )
    return program_errc::length_mismatch;

  if( recipients.empty() )
    return program_errc::empty_batch;

  std::uint64_t total = 0;
  for( auto amount: amounts )
  {
    if( std::numeric_limits< std::uint64_t >::max() - amount < total )
      return program_errc::overflow;

    total += amount;
  }

  const auto& caller = system->get_caller();

  if( _ledger.balance_of( system, caller ) < total )
    return program_errc::insufficient_balance;

  for( std::size_t i = 0; i < recipients.size(); ++i )
  {
    if( recipients[ i ].null() )
      return program_errc::invalid_recipient;

    if( auto error = _gate.can_transfer( system ); error )
      return error;

    if( auto error = _ledger.transfer( system, caller, recipients[ i ], amounts[ i ] ); error )
      return error;
  }

  return program_errc::ok;
}

std::error_code capped_token::transfer( system_interface* system )
{
  protocol::account to;
  std::uint64_t value = 0;

  if( auto error = read_account( system, to ); error )
    return error;

  if( auto error = read_integer( system, value ); error )
    return error;

  if( auto error = _gate.can_transfer( system ); error )
    return error;

  return _ledger.transfer( system, system->get_caller(), to, value );
}

bool capped_token::initialized( system_interface* system ) const
{
  return system->get_object( max_supply_id, std::span< const std::byte >{} ).size() > 0;
}

std::uint64_t capped_token::max_supply( system_interface* system ) const
{
  auto object = system->get_object( max_supply_id, std::span< const std::byte >{} );
  if( !object.size() )
    return 0;

  auto ceiling = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( ceiling );
  return ceiling;
}

} // namespace mintcap::program
