#pragma once

#include <expected>
#include <system_error>

namespace mintcap::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  invalid_instruction,
  invalid_argument,
  invalid_configuration,
  already_initialized,
  uninitialized,
  supply_exceeded,
  length_mismatch,
  empty_batch,
  insufficient_balance,
  invalid_recipient,
  transfers_paused,
  not_paused,
  invalid_owner,
  overflow
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintcap::program

template<>
struct std::is_error_code_enum< mintcap::program::program_errc >: public std::true_type
{};
