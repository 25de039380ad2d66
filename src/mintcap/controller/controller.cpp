#include <mintcap/controller/controller.hpp>
#include <mintcap/controller/execution_context.hpp>
#include <mintcap/controller/state.hpp>

#include <mintcap/log.hpp>
#include <mintcap/memory.hpp>

#include <boost/endian.hpp>

#include <algorithm>
#include <concepts>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mintcap::controller {

namespace {

template< std::integral T >
void append_integer( std::vector< std::byte >& buffer, T value )
{
  boost::endian::native_to_little_inplace( value );
  std::ranges::copy( memory::as_bytes( value ), std::back_inserter( buffer ) );
}

void append_string( std::vector< std::byte >& buffer, const std::string& str )
{
  append_integer( buffer, static_cast< std::uint32_t >( str.size() ) );
  std::ranges::copy( memory::as_bytes( str ), std::back_inserter( buffer ) );
}

bool is_reversion( const std::error_code& code )
{
  return code.category() == program::program_category() || code.category() == reversion_category();
}

} // namespace

std::vector< std::byte > make_construct_input( const state::genesis_data& data )
{
  std::vector< std::byte > input;
  append_integer( input, std::to_underlying( program::capped_token::instruction::construct ) );
  append_string( input, data.name );
  append_string( input, data.symbol );
  append_integer( input, data.max_supply );
  return input;
}

controller::controller()
{
  _program = std::make_shared< program::capped_token >();
}

controller::~controller()
{
  close();
}

void controller::open( const state::genesis_data& data )
{
  if( data.deployer.null() )
    throw std::system_error( controller_errc::invalid_caller, "genesis deployer is the null account" );

  auto error = _db.open(
    [ & ]( state_db::state_node_ptr& root )
    {
      execution_context context( _program, intent::call_application );
      context.set_state_node( root );

      protocol::call call{ .caller = data.deployer, .stdin = make_construct_input( data ) };

      if( auto output = context.run( call ); output.code )
        throw std::system_error( output.code, "token construction failed" );

      LOG_INFO( mintcap::log::instance(),
                "Deployed token {} ({}) - Max supply: {}, Owner: {}",
                data.name,
                data.symbol,
                data.max_supply,
                mintcap::log::hex{ data.deployer.data(), data.deployer.size() } );
    } );

  if( error )
    throw std::system_error( error );
}

void controller::close()
{
  _db.close();
}

result< protocol::call_receipt > controller::process( const protocol::call& call )
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  if( call.caller.null() )
    return std::unexpected( controller_errc::invalid_caller );

  if( call.stdin.size() < sizeof( std::uint32_t ) )
    return std::unexpected( controller_errc::malformed_call );

  LOG_DEBUG( mintcap::log::instance(),
             "Processing call - Caller: {}",
             mintcap::log::hex{ call.caller.data(), call.caller.size() } );

  auto node = _db.root()->make_child();

  execution_context context( _program, intent::call_application );
  context.set_state_node( node );

  auto output = context.run( call );
  context.clear_state_node();

  protocol::call_receipt receipt;
  receipt.caller = call.caller;
  receipt.code   = output.code;
  receipt.stdout = std::move( output.stdout );

  if( output.code )
  {
    if( !is_reversion( output.code ) )
      return std::unexpected( output.code );

    receipt.reverted = true;
    receipt.stdout.clear();
    receipt.revision = _db.root()->revision();

    LOG_INFO( mintcap::log::instance(),
              "Call reverted - Caller: {}, Reason: {}",
              mintcap::log::hex{ call.caller.data(), call.caller.size() },
              output.code.message() );

    return receipt;
  }

  if( auto error = node->squash(); error )
    return std::unexpected( error );

  receipt.events   = context.events();
  receipt.revision = _db.root()->revision();

  LOG_INFO( mintcap::log::instance(),
            "Call applied - Caller: {}, Revision: {} [{} event(s)]",
            mintcap::log::hex{ call.caller.data(), call.caller.size() },
            receipt.revision,
            receipt.events.size() );

  return receipt;
}

result< protocol::program_output > controller::read( const protocol::call& call ) const
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  if( call.stdin.size() < sizeof( std::uint32_t ) )
    return std::unexpected( controller_errc::malformed_call );

  execution_context context( _program );
  context.set_state_node( _db.root()->make_child() );

  return context.run( call );
}

std::uint64_t controller::revision() const
{
  if( !_db.is_open() )
    throw std::runtime_error( "database is not open" );

  return _db.root()->revision();
}

} // namespace mintcap::controller
