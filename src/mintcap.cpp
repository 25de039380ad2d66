#include <algorithm>
#include <concepts>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <print>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/endian.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mintcap/controller.hpp>
#include <mintcap/encode.hpp>
#include <mintcap/log.hpp>
#include <mintcap/memory.hpp>
#include <mintcap/options.hpp>
#include <mintcap/program.hpp>
#include <mintcap/protocol.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto help_option       = "help,h"s;
constexpr auto version_option    = "version,v"s;
constexpr auto basedir_option    = "basedir,d"s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;
constexpr auto name_option       = "name"s;
constexpr auto symbol_option     = "symbol"s;
constexpr auto max_supply_option = "max-supply"s;
constexpr auto owner_option      = "owner"s;
constexpr auto script_option     = "script,s"s;

constexpr auto service_section = "mintcap"s;

} // namespace constants

using instruction = mintcap::program::capped_token::instruction;
using mintcap::options::get_option;

namespace {

mintcap::protocol::account parse_account( const std::string& str )
{
  auto account = mintcap::protocol::account_from_hex( str );
  if( !account )
    throw std::runtime_error( "invalid account '" + str + "': " + account.error().message() );

  return *account;
}

instruction parse_instruction( const std::string& op )
{
  static const std::vector< std::pair< std::string, instruction > > instructions{
    {               "name",               instruction::name },
    {             "symbol",             instruction::symbol },
    {           "decimals",           instruction::decimals },
    {       "total_supply",       instruction::total_supply },
    {         "max_supply",         instruction::max_supply },
    {         "balance_of",         instruction::balance_of },
    {              "owner",              instruction::owner },
    {             "paused",             instruction::paused },
    {           "transfer",           instruction::transfer },
    {               "mint",               instruction::mint },
    {          "multisend",          instruction::multisend },
    {              "pause",              instruction::pause },
    {            "unpause",            instruction::unpause },
    { "transfer_ownership", instruction::transfer_ownership },
    { "renounce_ownership", instruction::renounce_ownership }
  };

  auto itr = std::ranges::find( instructions, op, &std::pair< std::string, instruction >::first );
  if( itr == instructions.end() )
    throw std::runtime_error( "unknown operation '" + op + "'" );

  return itr->second;
}

bool read_only( instruction i )
{
  return i < instruction::transfer;
}

template< std::integral T >
void append_integer( std::vector< std::byte >& input, T t )
{
  boost::endian::native_to_little_inplace( t );
  std::ranges::copy( mintcap::memory::as_bytes( t ), std::back_inserter( input ) );
}

void append_account( std::vector< std::byte >& input,
                     const mintcap::protocol::account& account,
                     std::vector< mintcap::protocol::account >& touched )
{
  std::ranges::copy( account, std::back_inserter( input ) );

  if( !account.null() && std::ranges::find( touched, account ) == touched.end() )
    touched.push_back( account );
}

mintcap::protocol::call
make_call( const YAML::Node& entry, instruction i, std::vector< mintcap::protocol::account >& touched )
{
  mintcap::protocol::call call;
  call.caller = parse_account( entry[ "caller" ].as< std::string >() );
  append_integer( call.stdin, std::to_underlying( i ) );

  switch( i )
  {
    case instruction::balance_of:
      append_account( call.stdin, parse_account( entry[ "account" ].as< std::string >() ), touched );
      break;
    case instruction::transfer:
    case instruction::mint:
      append_account( call.stdin, parse_account( entry[ "to" ].as< std::string >() ), touched );
      append_integer( call.stdin, entry[ "amount" ].as< std::uint64_t >() );
      break;
    case instruction::multisend:
      {
        auto recipients = entry[ "recipients" ].as< std::vector< std::string > >();
        auto amounts    = entry[ "amounts" ].as< std::vector< std::uint64_t > >();

        append_integer( call.stdin, static_cast< std::uint32_t >( recipients.size() ) );
        for( const auto& recipient: recipients )
          append_account( call.stdin, parse_account( recipient ), touched );

        append_integer( call.stdin, static_cast< std::uint32_t >( amounts.size() ) );
        for( auto amount: amounts )
          append_integer( call.stdin, amount );
      }
      break;
    case instruction::transfer_ownership:
      append_account( call.stdin, parse_account( entry[ "new_owner" ].as< std::string >() ), touched );
      break;
    default:
      break;
  }

  if( std::ranges::find( touched, call.caller ) == touched.end() )
    touched.push_back( call.caller );

  return call;
}

std::uint64_t read_integer( mintcap::controller::controller& controller,
                            const mintcap::protocol::account& caller,
                            std::vector< std::byte >&& stdin )
{
  auto output = controller.read( mintcap::protocol::call{ .caller = caller, .stdin = std::move( stdin ) } );
  if( !output )
    throw std::system_error( output.error() );

  if( output->code )
    throw std::system_error( output->code );

  return boost::endian::little_to_native( mintcap::memory::bit_cast< std::uint64_t >( output->stdout ) );
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  mintcap::log::initialize();

  std::string log_level;
  std::filesystem::path script_file;
  mintcap::controller::state::genesis_data genesis_data;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()      , "Print this help message and exit" )
      ( constants::version_option.data()   , "Print version string and exit" )
      ( constants::basedir_option.data()   , boost::program_options::value< std::string >()->default_value( "." ), "Directory holding config.yml" )
      ( constants::log_level_option.data() , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::name_option.data()      , boost::program_options::value< std::string >(), "The token name" )
      ( constants::symbol_option.data()    , boost::program_options::value< std::string >(), "The token symbol" )
      ( constants::max_supply_option.data(), boost::program_options::value< std::string >(), "The supply ceiling" )
      ( constants::owner_option.data()     , boost::program_options::value< std::string >(), "The deployer and initial owner (hex)" )
      ( constants::script_option.data()    , boost::program_options::value< std::string >(), "YAML file with the calls to apply" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "v0.1.0" );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      service_config = config[ constants::service_section ];
    }

    // clang-format off
    log_level                = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config );
    genesis_data.name        = get_option< std::string >( constants::name_option, "", args, service_config );
    genesis_data.symbol      = get_option< std::string >( constants::symbol_option, "", args, service_config );
    auto max_supply_text     = get_option< std::string >( constants::max_supply_option, "", args, service_config );
    genesis_data.deployer    = parse_account( get_option< std::string >( constants::owner_option, "", args, service_config ) );
    script_file              = get_option< std::string >( constants::script_option, "", args, service_config );
    // clang-format on

    auto max_supply = mintcap::options::parse_max_supply( max_supply_text );
    if( !max_supply )
      throw std::runtime_error( "invalid max supply '" + max_supply_text + "': " + max_supply.error().message() );

    genesis_data.max_supply = *max_supply;

    if( auto error = mintcap::log::set_level( log_level ); error )
      throw std::runtime_error( "invalid log level '" + log_level + "'" );

    if( config.IsNull() )
      LOG_WARNING( mintcap::log::instance(), "Could not find config (config.yml or config.yaml expected)" );

    if( !script_file.empty() && script_file.is_relative() )
      script_file = basedir / script_file;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( mintcap::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  mintcap::controller::controller controller;

  try
  {
    controller.open( genesis_data );

    std::vector< mintcap::protocol::account > touched{ genesis_data.deployer };

    if( !script_file.empty() )
    {
      auto script = YAML::LoadFile( script_file.string() );
      if( !script.IsSequence() )
        throw std::runtime_error( "script must be a sequence of calls" );

      for( const auto& entry: script )
      {
        auto i    = parse_instruction( entry[ "op" ].as< std::string >() );
        auto call = make_call( entry, i, touched );

        if( read_only( i ) )
        {
          auto output = controller.read( call );
          if( !output )
            throw std::system_error( output.error() );

          std::println( "{}: {}",
                        entry[ "op" ].as< std::string >(),
                        output->code ? output->code.message() : mintcap::encode::to_hex( output->stdout ) );
          continue;
        }

        auto receipt = controller.process( call );
        if( !receipt )
          throw std::system_error( receipt.error() );

        std::println( "{}: {} (revision {}, {} event(s))",
                      entry[ "op" ].as< std::string >(),
                      receipt->reverted ? "reverted, " + receipt->code.message() : std::string( "applied" ),
                      receipt->revision,
                      receipt->events.size() );
      }
    }

    std::vector< std::byte > supply_input;
    append_integer( supply_input, std::to_underlying( instruction::total_supply ) );
    std::println( "total supply: {}", read_integer( controller, genesis_data.deployer, std::move( supply_input ) ) );

    for( const auto& account: touched )
    {
      std::vector< std::byte > input;
      append_integer( input, std::to_underlying( instruction::balance_of ) );
      std::ranges::copy( account, std::back_inserter( input ) );

      std::println( "{}: {}",
                    mintcap::encode::to_hex( account ),
                    read_integer( controller, genesis_data.deployer, std::move( input ) ) );
    }
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( mintcap::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  controller.close();

  return retcode;
}
