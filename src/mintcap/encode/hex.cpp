#include <mintcap/encode/hex.hpp>

#include <cstddef>
#include <cstdint>

namespace mintcap::encode {

constexpr std::string_view digits = "0123456789abcdef";
constexpr std::uint8_t invalid_nibble = 0xff;
constexpr std::uint8_t nibble_width   = 4;
constexpr std::uint8_t nibble_mask    = 0x0f;

static constexpr std::uint8_t nibble( char c ) noexcept
{
  constexpr std::uint8_t letter_offset = 10;

  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );
  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + letter_offset );
  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + letter_offset );

  return invalid_nibble;
}

static std::string_view strip_prefix( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  return sv;
}

static std::error_code decode( std::string_view sv, std::span< std::byte > out ) noexcept
{
  for( std::size_t i = 0; i < out.size(); ++i )
  {
    auto high = nibble( sv[ 2 * i ] );
    auto low  = nibble( sv[ 2 * i + 1 ] );

    if( high == invalid_nibble || low == invalid_nibble )
      return encode_errc::invalid_character;

    out[ i ] = static_cast< std::byte >( ( high << nibble_width ) | low );
  }

  return encode_errc::ok;
}

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str;
  str.reserve( 2 + 2 * s.size() );
  str.append( "0x" );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( digits[ value >> nibble_width ] );
    str.push_back( digits[ value & nibble_mask ] );
  }

  return str;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 )
    return std::unexpected( encode_errc::odd_length );

  std::vector< std::byte > bytes( sv.size() / 2 );
  if( auto error = decode( sv, bytes ); error )
    return std::unexpected( error );

  return bytes;
}

std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept
{
  sv = strip_prefix( sv );

  if( sv.size() % 2 )
    return encode_errc::odd_length;

  if( sv.size() / 2 != out.size() )
    return encode_errc::size_mismatch;

  return decode( sv, out );
}

} // namespace mintcap::encode
