// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/endian.hpp>

#include <mintcap/controller.hpp>
#include <mintcap/log.hpp>
#include <mintcap/memory.hpp>
#include <mintcap/protocol.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level, std::uint64_t max_supply )
{
  mintcap::log::initialize();
  if( auto error = mintcap::log::set_level( log_level ); error )
    LOG_WARNING( mintcap::log::instance(), "Unknown log level: {}", log_level );

  _deployer = make_account( "deployer" );

  _genesis_data.deployer   = _deployer;
  _genesis_data.name       = "Capped Token";
  _genesis_data.symbol     = "CAP";
  _genesis_data.max_supply = max_supply;

  LOG_INFO( mintcap::log::instance(), "Opening controller for {}", name );

  _controller = std::make_unique< mintcap::controller::controller >();
  _controller->open( _genesis_data );
}

fixture::~fixture()
{
  _controller->close();
}

mintcap::protocol::account fixture::make_account( std::string_view seed ) noexcept
{
  return mintcap::protocol::system_program( seed );
}

mintcap::protocol::call fixture::make_call( const mintcap::protocol::account& caller,
                                            std::vector< std::byte >&& stdin ) const
{
  mintcap::protocol::call c;
  c.caller = caller;
  c.stdin  = std::move( stdin );
  return c;
}

mintcap::controller::result< mintcap::protocol::call_receipt >
fixture::mint( const mintcap::protocol::account& caller, const mintcap::protocol::account& to, std::uint64_t amount )
{
  return _controller->process( make_call( caller, make_stdin( instruction::mint, to, amount ) ) );
}

mintcap::controller::result< mintcap::protocol::call_receipt >
fixture::transfer( const mintcap::protocol::account& caller, const mintcap::protocol::account& to, std::uint64_t amount )
{
  return _controller->process( make_call( caller, make_stdin( instruction::transfer, to, amount ) ) );
}

mintcap::controller::result< mintcap::protocol::call_receipt >
fixture::multisend( const mintcap::protocol::account& caller,
                    const std::vector< mintcap::protocol::account >& recipients,
                    const std::vector< std::uint64_t >& amounts )
{
  return _controller->process( make_call( caller, make_stdin( instruction::multisend, recipients, amounts ) ) );
}

std::uint64_t fixture::balance_of( const mintcap::protocol::account& account ) const
{
  auto response = _controller->read( make_call( _deployer, make_stdin( instruction::balance_of, account ) ) );
  if( !response.has_value() || response->code )
    throw std::runtime_error( "balance_of failed" );

  return boost::endian::little_to_native( mintcap::memory::bit_cast< std::uint64_t >( response->stdout ) );
}

std::uint64_t fixture::total_supply() const
{
  auto response = _controller->read( make_call( _deployer, make_stdin( instruction::total_supply ) ) );
  if( !response.has_value() || response->code )
    throw std::runtime_error( "total_supply failed" );

  return boost::endian::little_to_native( mintcap::memory::bit_cast< std::uint64_t >( response->stdout ) );
}

bool fixture::verify( mintcap::controller::result< mintcap::protocol::call_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( mintcap::log::instance(), "Call submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( mintcap::log::instance(),
                 "Call from {} was reverted: {}",
                 mintcap::log::hex{ receipt->caller.data(), receipt->caller.size() },
                 receipt->code.message() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
