#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace mintcap::options {

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * Resolves an option from the command line first, then the mintcap section
 * of config.yml, then the default.
 */
template< typename T >
T get_option( std::string key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& config )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.resize( pos );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( config && config[ key ] )
    return config[ key ].as< T >();

  return default_value;
}

/**
 * Parses a supply ceiling given as decimal text. Only positive values that
 * fit in 64 bits are accepted; signs are rejected.
 */
result< std::uint64_t > parse_max_supply( std::string_view str ) noexcept;

} // namespace mintcap::options
