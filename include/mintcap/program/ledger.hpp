#pragma once

#include <cstdint>

#include <mintcap/program/error.hpp>
#include <mintcap/program/system_interface.hpp>

namespace mintcap::program {

/**
 * Balance ledger of the token. Balances and the total supply live in the
 * program's object space; an absent object reads as zero.
 *
 * The ledger enforces its own accounting rules (no null recipient, no
 * overdraft, no overflow) but knows nothing of ownership, pausing or the
 * supply ceiling.
 */
struct ledger
{
  std::uint64_t total_supply( system_interface* system ) const;
  std::uint64_t balance_of( system_interface* system, const protocol::account& account ) const;

  std::error_code transfer( system_interface* system,
                            const protocol::account& from,
                            const protocol::account& to,
                            std::uint64_t value ) const;

  std::error_code mint( system_interface* system, const protocol::account& to, std::uint64_t value ) const;

private:
  std::error_code
  emit_transfer( system_interface* system, const protocol::account& from, const protocol::account& to, std::uint64_t value )
    const;
};

} // namespace mintcap::program
