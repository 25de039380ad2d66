#include <mintcap/encode/hex.hpp>
#include <mintcap/protocol/account.hpp>

#include <algorithm>

namespace mintcap::protocol {

bool account::null() const noexcept
{
  return std::ranges::all_of( *this,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

encode::result< account > account_from_hex( std::string_view sv ) noexcept
{
  account a{};
  if( auto error = encode::from_hex( sv, a ); error )
    return std::unexpected( error );

  return a;
}

account system_program( std::string_view str ) noexcept
{
  account a{};
  auto length = std::min( str.size(), a.size() );
  std::ranges::transform( str.substr( 0, length ),
                          a.begin(),
                          []( char c )
                          {
                            return static_cast< std::byte >( c );
                          } );
  return a;
}

} // namespace mintcap::protocol
