#include <mintcap/program/error.hpp>

#include <string>
#include <utility>

namespace mintcap::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::unauthorized:
        return "caller is not the owner"s;
      case program_errc::invalid_instruction:
        return "invalid instruction"s;
      case program_errc::invalid_argument:
        return "invalid argument"s;
      case program_errc::invalid_configuration:
        return "invalid token configuration"s;
      case program_errc::already_initialized:
        return "token is already initialized"s;
      case program_errc::uninitialized:
        return "token is not initialized"s;
      case program_errc::supply_exceeded:
        return "max supply exceeded"s;
      case program_errc::length_mismatch:
        return "recipients and amounts length mismatch"s;
      case program_errc::empty_batch:
        return "empty batch"s;
      case program_errc::insufficient_balance:
        return "insufficient balance"s;
      case program_errc::invalid_recipient:
        return "invalid recipient"s;
      case program_errc::transfers_paused:
        return "transfers are paused"s;
      case program_errc::not_paused:
        return "transfers are not paused"s;
      case program_errc::invalid_owner:
        return "invalid owner"s;
      case program_errc::overflow:
        return "overflow"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace mintcap::program
