#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include <mintcap/encode/error.hpp>

namespace mintcap::protocol {

constexpr std::size_t account_length = 32;

struct account: std::array< std::byte, account_length >
{
  /**
   * The null account is all zeroes. It never holds a balance and can never
   * own the token.
   */
  bool null() const noexcept;
};

constexpr account null_account{};

encode::result< account > account_from_hex( std::string_view sv ) noexcept;

/**
 * Builds the account of a native program from its name.
 */
account system_program( std::string_view str ) noexcept;

} // namespace mintcap::protocol
