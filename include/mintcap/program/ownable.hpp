#pragma once

#include <mintcap/program/error.hpp>
#include <mintcap/program/system_interface.hpp>

namespace mintcap::program {

/**
 * Single owner access control. The owner is stored in the program's object
 * space; a renounced token has the null account as owner.
 */
struct ownable
{
  protocol::account owner( system_interface* system ) const;

  /**
   * Returns ok when caller is the stored owner and unauthorized otherwise.
   */
  std::error_code authorize( system_interface* system, const protocol::account& caller ) const;

  std::error_code initialize( system_interface* system, const protocol::account& owner ) const;
  std::error_code transfer_ownership( system_interface* system, const protocol::account& new_owner ) const;
  std::error_code renounce_ownership( system_interface* system ) const;

private:
  std::error_code set_owner( system_interface* system, const protocol::account& new_owner ) const;
};

} // namespace mintcap::program
