#pragma once

#include <system_error>

#include <mintcap/program/system_interface.hpp>

namespace mintcap::program {

/**
 * A native program. run() consumes the call's input through the system
 * interface and returns the first error it hits; the host decides what
 * happens to the writes made before that.
 */
struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system ) = 0;
};

} // namespace mintcap::program
