#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <mintcap/encode/error.hpp>

namespace mintcap::encode {

/**
 * Lower case hex with a 0x prefix.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

/**
 * Decodes hex with or without a 0x prefix.
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decodes hex into out, which the input has to fill exactly.
 */
std::error_code from_hex( std::string_view sv, std::span< std::byte > out ) noexcept;

} // namespace mintcap::encode
