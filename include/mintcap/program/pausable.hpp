#pragma once

#include <mintcap/program/error.hpp>
#include <mintcap/program/system_interface.hpp>

namespace mintcap::program {

/**
 * Global transfer gate. The paused flag exists as an object only while the
 * token is paused.
 */
struct pausable
{
  bool paused( system_interface* system ) const;

  /**
   * Returns transfers_paused while the gate is closed.
   */
  std::error_code can_transfer( system_interface* system ) const;

  std::error_code pause( system_interface* system ) const;
  std::error_code unpause( system_interface* system ) const;
};

} // namespace mintcap::program
