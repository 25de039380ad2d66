#include <mintcap/options.hpp>

#include <charconv>

namespace mintcap::options {

result< std::uint64_t > parse_max_supply( std::string_view str ) noexcept
{
  // from_chars would accept neither sign, but reject them explicitly so
  // "-1" never reaches an unsigned conversion.
  if( str.empty() || str.front() == '-' || str.front() == '+' )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  std::uint64_t value = 0;
  auto [ ptr, ec ] = std::from_chars( str.data(), str.data() + str.size(), value );

  if( ec != std::errc{} )
    return std::unexpected( std::make_error_code( ec ) );

  if( ptr != str.data() + str.size() || !value )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  return value;
}

} // namespace mintcap::options
