#pragma once

#include <string_view>
#include <system_error>

#include <quill/LogMacros.h>

#include <mintcap/log/formatter.hpp>
#include <mintcap/log/frontend.hpp>

namespace mintcap::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the filtering level of the root logger from its name
 * (e.g. debug, info, warning, error).
 */
std::error_code set_level( std::string_view level ) noexcept;

} // namespace mintcap::log
