// NOLINTBEGIN

#include <gtest/gtest.h>

#include <boost/endian.hpp>

#include <mintcap/memory.hpp>
#include <mintcap/program.hpp>

#include <algorithm>
#include <limits>
#include <map>
#include <utility>

using mintcap::program::program_errc;

namespace {

class memory_system final: public mintcap::program::system_interface
{
public:
  std::error_code read( mintcap::program::file_descriptor fd, std::span< std::byte > buffer ) override
  {
    if( fd != mintcap::program::file_descriptor::stdin )
      return std::make_error_code( std::errc::bad_file_descriptor );

    if( input.size() - offset < buffer.size() )
      return std::make_error_code( std::errc::no_message_available );

    std::ranges::copy( std::span( input ).subspan( offset, buffer.size() ), buffer.begin() );
    offset += buffer.size();
    return {};
  }

  std::error_code write( mintcap::program::file_descriptor fd, std::span< const std::byte > buffer ) override
  {
    if( fd != mintcap::program::file_descriptor::stdout )
      return std::make_error_code( std::errc::bad_file_descriptor );

    output.insert( output.end(), buffer.begin(), buffer.end() );
    return {};
  }

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) override
  {
    if( auto it = objects.find( { id, std::vector( key.begin(), key.end() ) } ); it != objects.end() )
      return it->second;

    return {};
  }

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) override
  {
    objects[ { id, std::vector( key.begin(), key.end() ) } ] = std::vector( value.begin(), value.end() );
    return {};
  }

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) override
  {
    objects.erase( { id, std::vector( key.begin(), key.end() ) } );
    return {};
  }

  const mintcap::protocol::account& get_caller() override
  {
    return caller;
  }

  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< mintcap::protocol::account >& impacted ) override
  {
    mintcap::protocol::event ev;
    ev.sequence = static_cast< std::uint32_t >( events.size() );
    ev.name     = std::string( name );
    ev.data     = std::vector( data.begin(), data.end() );
    ev.impacted = impacted;
    events.emplace_back( std::move( ev ) );
    return {};
  }

  template< std::integral T >
  void push( T t )
  {
    boost::endian::native_to_little_inplace( t );
    auto bytes = mintcap::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  void push( mintcap::program::capped_token::instruction i )
  {
    push( std::to_underlying( i ) );
  }

  void push( const mintcap::protocol::account& a )
  {
    input.insert( input.end(), a.begin(), a.end() );
  }

  void push( std::string_view s )
  {
    push( static_cast< std::uint32_t >( s.size() ) );
    auto bytes = mintcap::memory::as_bytes( s );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename... Args >
  void call( const mintcap::protocol::account& from, Args... args )
  {
    caller = from;
    input.clear();
    output.clear();
    events.clear();
    offset = 0;
    ( push( args ), ... );
  }

  std::uint64_t output_integer() const
  {
    return boost::endian::little_to_native( mintcap::memory::bit_cast< std::uint64_t >( output ) );
  }

  std::map< std::pair< std::uint32_t, std::vector< std::byte > >, std::vector< std::byte > > objects;
  std::vector< std::byte > input;
  std::size_t offset = 0;
  std::vector< std::byte > output;
  std::vector< mintcap::protocol::event > events;
  mintcap::protocol::account caller{};
};

mintcap::protocol::account make_account( std::uint8_t seed )
{
  mintcap::protocol::account a{};
  a.fill( std::byte{ seed } );
  return a;
}

using instruction = mintcap::program::capped_token::instruction;

} // namespace

TEST( ledger, accounting )
{
  memory_system system;
  mintcap::program::ledger ledger;

  auto alice = make_account( 0x01 );
  auto bob   = make_account( 0x02 );

  EXPECT_EQ( ledger.total_supply( &system ), 0u );
  EXPECT_EQ( ledger.balance_of( &system, alice ), 0u );

  EXPECT_FALSE( ledger.mint( &system, alice, 100 ) );
  EXPECT_EQ( ledger.total_supply( &system ), 100u );
  EXPECT_EQ( ledger.balance_of( &system, alice ), 100u );

  EXPECT_EQ( ledger.mint( &system, mintcap::protocol::null_account, 1 ), program_errc::invalid_recipient );
  EXPECT_EQ( ledger.mint( &system, bob, std::numeric_limits< std::uint64_t >::max() ), program_errc::overflow );

  EXPECT_FALSE( ledger.transfer( &system, alice, bob, 30 ) );
  EXPECT_EQ( ledger.balance_of( &system, alice ), 70u );
  EXPECT_EQ( ledger.balance_of( &system, bob ), 30u );

  EXPECT_EQ( ledger.transfer( &system, alice, bob, 71 ), program_errc::insufficient_balance );
  EXPECT_EQ( ledger.transfer( &system, alice, mintcap::protocol::null_account, 1 ), program_errc::invalid_recipient );

  EXPECT_FALSE( ledger.transfer( &system, bob, bob, 30 ) );
  EXPECT_EQ( ledger.balance_of( &system, bob ), 30u );
  EXPECT_EQ( ledger.total_supply( &system ), 100u );

  ASSERT_EQ( system.events.size(), 3u );
  EXPECT_EQ( system.events[ 0 ].name, "transfer" );
  ASSERT_EQ( system.events[ 0 ].impacted.size(), 2u );
  EXPECT_TRUE( system.events[ 0 ].impacted[ 0 ].null() );
  EXPECT_EQ( system.events[ 0 ].impacted[ 1 ], alice );
}

TEST( ownable, authorization )
{
  memory_system system;
  mintcap::program::ownable ownable;

  auto alice = make_account( 0x01 );
  auto bob   = make_account( 0x02 );

  EXPECT_TRUE( ownable.owner( &system ).null() );
  EXPECT_EQ( ownable.authorize( &system, alice ), program_errc::unauthorized );

  EXPECT_EQ( ownable.initialize( &system, mintcap::protocol::null_account ), program_errc::invalid_owner );
  EXPECT_FALSE( ownable.initialize( &system, alice ) );
  EXPECT_EQ( ownable.owner( &system ), alice );
  EXPECT_FALSE( ownable.authorize( &system, alice ) );
  EXPECT_EQ( ownable.authorize( &system, bob ), program_errc::unauthorized );

  EXPECT_EQ( ownable.transfer_ownership( &system, mintcap::protocol::null_account ), program_errc::invalid_owner );
  EXPECT_FALSE( ownable.transfer_ownership( &system, bob ) );
  EXPECT_EQ( ownable.authorize( &system, alice ), program_errc::unauthorized );
  EXPECT_FALSE( ownable.authorize( &system, bob ) );

  EXPECT_FALSE( ownable.renounce_ownership( &system ) );
  EXPECT_TRUE( ownable.owner( &system ).null() );
  EXPECT_EQ( ownable.authorize( &system, bob ), program_errc::unauthorized );
  EXPECT_EQ( ownable.authorize( &system, mintcap::protocol::null_account ), program_errc::unauthorized );

  ASSERT_EQ( system.events.size(), 3u );
  for( const auto& ev: system.events )
    EXPECT_EQ( ev.name, "ownership_transferred" );
}

TEST( pausable, gate )
{
  memory_system system;
  mintcap::program::pausable gate;

  EXPECT_FALSE( gate.paused( &system ) );
  EXPECT_FALSE( gate.can_transfer( &system ) );
  EXPECT_EQ( gate.unpause( &system ), program_errc::not_paused );

  EXPECT_FALSE( gate.pause( &system ) );
  EXPECT_TRUE( gate.paused( &system ) );
  EXPECT_EQ( gate.can_transfer( &system ), program_errc::transfers_paused );
  EXPECT_EQ( gate.pause( &system ), program_errc::transfers_paused );

  EXPECT_FALSE( gate.unpause( &system ) );
  EXPECT_FALSE( gate.paused( &system ) );
  EXPECT_FALSE( gate.can_transfer( &system ) );

  ASSERT_EQ( system.events.size(), 2u );
  EXPECT_EQ( system.events[ 0 ].name, "paused" );
  EXPECT_EQ( system.events[ 1 ].name, "unpaused" );
}

TEST( capped_token, lifecycle )
{
  memory_system system;
  mintcap::program::capped_token token;

  auto owner = make_account( 0x0a );
  auto alice = make_account( 0x01 );
  auto bob   = make_account( 0x02 );

  system.call( owner, instruction::total_supply );
  EXPECT_EQ( token.run( &system ), program_errc::uninitialized );

  system.call( owner, instruction::construct, std::string_view( "Token" ), std::string_view( "TKN" ), std::uint64_t( 0 ) );
  EXPECT_EQ( token.run( &system ), program_errc::invalid_configuration );

  system.call( owner, instruction::construct, std::string_view( "" ), std::string_view( "TKN" ), std::uint64_t( 10 ) );
  EXPECT_EQ( token.run( &system ), program_errc::invalid_configuration );

  system.call( owner, instruction::construct, std::string_view( "Token" ), std::string_view( "TKN" ), std::uint64_t( 1'000 ) );
  EXPECT_FALSE( token.run( &system ) );

  system.call( owner, instruction::construct, std::string_view( "Token" ), std::string_view( "TKN" ), std::uint64_t( 1'000 ) );
  EXPECT_EQ( token.run( &system ), program_errc::already_initialized );

  system.call( alice, instruction::max_supply );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( system.output_integer(), 1'000u );

  system.call( alice, instruction::decimals );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( boost::endian::little_to_native( mintcap::memory::bit_cast< std::uint32_t >( system.output ) ), 8u );

  system.call( alice, instruction::owner );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_TRUE( std::ranges::equal( system.output, owner ) );

  system.call( alice, instruction::mint, bob, std::uint64_t( 10 ) );
  EXPECT_EQ( token.run( &system ), program_errc::unauthorized );

  system.call( owner, instruction::mint, alice, std::uint64_t( 1'000 ) );
  EXPECT_FALSE( token.run( &system ) );

  system.call( owner, instruction::mint, alice, std::uint64_t( 1 ) );
  EXPECT_EQ( token.run( &system ), program_errc::supply_exceeded );

  system.call( alice, instruction::transfer, bob, std::uint64_t( 250 ) );
  EXPECT_FALSE( token.run( &system ) );

  system.call( alice, instruction::balance_of, bob );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( system.output_integer(), 250u );

  system.call( alice, instruction::total_supply );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( system.output_integer(), 1'000u );
}

TEST( capped_token, multisend_checks_before_writing )
{
  memory_system system;
  mintcap::program::capped_token token;

  auto owner   = make_account( 0x0a );
  auto alice   = make_account( 0x01 );
  auto bob     = make_account( 0x02 );
  auto charlie = make_account( 0x03 );

  system.call( owner, instruction::construct, std::string_view( "Token" ), std::string_view( "TKN" ), std::uint64_t( 1'000 ) );
  ASSERT_FALSE( token.run( &system ) );

  system.call( owner, instruction::mint, alice, std::uint64_t( 100 ) );
  ASSERT_FALSE( token.run( &system ) );

  auto snapshot = system.objects;

  system.call( alice,
               instruction::multisend,
               std::uint32_t( 2 ),
               bob,
               charlie,
               std::uint32_t( 2 ),
               std::uint64_t( 60 ),
               std::uint64_t( 50 ) );
  EXPECT_EQ( token.run( &system ), program_errc::insufficient_balance );
  EXPECT_EQ( system.objects, snapshot );
  EXPECT_TRUE( system.events.empty() );

  system.call( alice, instruction::multisend, std::uint32_t( 2 ), bob, charlie, std::uint32_t( 1 ), std::uint64_t( 60 ) );
  EXPECT_EQ( token.run( &system ), program_errc::length_mismatch );
  EXPECT_EQ( system.objects, snapshot );

  system.call( alice, instruction::multisend, std::uint32_t( 0 ), std::uint32_t( 0 ) );
  EXPECT_EQ( token.run( &system ), program_errc::empty_batch );

  system.call( alice, instruction::multisend, std::uint32_t( 2 ), bob );
  EXPECT_EQ( token.run( &system ), program_errc::invalid_argument );

  system.call( alice,
               instruction::multisend,
               std::uint32_t( 2 ),
               bob,
               charlie,
               std::uint32_t( 2 ),
               std::uint64_t( 60 ),
               std::uint64_t( 40 ) );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( system.events.size(), 2u );

  system.call( alice, instruction::balance_of, alice );
  EXPECT_FALSE( token.run( &system ) );
  EXPECT_EQ( system.output_integer(), 0u );
}

TEST( capped_token, invalid_instruction )
{
  memory_system system;
  mintcap::program::capped_token token;

  system.call( make_account( 0x0a ), std::uint32_t( 16 ) );
  EXPECT_EQ( token.run( &system ), program_errc::invalid_instruction );

  system.call( make_account( 0x0a ) );
  EXPECT_EQ( token.run( &system ), program_errc::invalid_argument );
}

// NOLINTEND
