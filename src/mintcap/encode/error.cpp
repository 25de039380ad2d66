#include <mintcap/encode/error.hpp>

#include <string>
#include <utility>

namespace mintcap::encode {

struct _encode_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "encode";
  }

  std::string message( int condition ) const noexcept final
  {
    using namespace std::string_literals;
    switch( static_cast< encode_errc >( condition ) )
    {
      case encode_errc::ok:
        return "ok"s;
      case encode_errc::invalid_character:
        return "non-hex character in input"s;
      case encode_errc::odd_length:
        return "hex input has an odd number of digits"s;
      case encode_errc::size_mismatch:
        return "decoded value has the wrong size"s;
    }
    std::unreachable();
  }
};

const std::error_category& encode_category() noexcept
{
  static _encode_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return { static_cast< int >( e ), encode_category() };
}

} // namespace mintcap::encode
