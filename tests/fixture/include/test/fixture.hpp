#pragma once

#include <ranges>

#include <boost/endian.hpp>

#include <mintcap/controller.hpp>
#include <mintcap/memory.hpp>
#include <mintcap/program.hpp>
#include <mintcap/protocol.hpp>

#include <memory>
#include <string>
#include <vector>

namespace test {

using instruction = mintcap::program::capped_token::instruction;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level, std::uint64_t max_supply = 1'000 );
  ~fixture();

  static mintcap::protocol::account make_account( std::string_view seed ) noexcept;

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = mintcap::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< std::ranges::range T >
  void append_stdin( std::vector< std::byte >& input, const T& t ) const noexcept
  {
    const auto bytes = mintcap::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  void append_stdin( std::vector< std::byte >& input, const std::vector< mintcap::protocol::account >& accounts ) const
  {
    append_stdin( input, static_cast< std::uint32_t >( accounts.size() ) );
    for( const auto& account: accounts )
      append_stdin( input, account );
  }

  void append_stdin( std::vector< std::byte >& input, const std::vector< std::uint64_t >& amounts ) const
  {
    append_stdin( input, static_cast< std::uint32_t >( amounts.size() ) );
    for( auto amount: amounts )
      append_stdin( input, amount );
  }

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  mintcap::protocol::call make_call( const mintcap::protocol::account& caller, std::vector< std::byte >&& stdin ) const;

  mintcap::controller::result< mintcap::protocol::call_receipt >
  mint( const mintcap::protocol::account& caller, const mintcap::protocol::account& to, std::uint64_t amount );
  mintcap::controller::result< mintcap::protocol::call_receipt >
  transfer( const mintcap::protocol::account& caller, const mintcap::protocol::account& to, std::uint64_t amount );
  mintcap::controller::result< mintcap::protocol::call_receipt >
  multisend( const mintcap::protocol::account& caller,
             const std::vector< mintcap::protocol::account >& recipients,
             const std::vector< std::uint64_t >& amounts );

  std::uint64_t balance_of( const mintcap::protocol::account& account ) const;
  std::uint64_t total_supply() const;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1
  };

  bool verify( mintcap::controller::result< mintcap::protocol::call_receipt > receipt, std::uint64_t flags ) const;

  std::unique_ptr< mintcap::controller::controller > _controller;
  mintcap::controller::state::genesis_data _genesis_data;
  mintcap::protocol::account _deployer;
};

} // namespace test
