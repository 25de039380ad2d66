#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <mintcap/program/error.hpp>
#include <mintcap/program/ledger.hpp>
#include <mintcap/program/ownable.hpp>
#include <mintcap/program/pausable.hpp>
#include <mintcap/program/program.hpp>

namespace mintcap::program {

/**
 * Fungible token with a fixed supply ceiling, owner-only minting, a
 * transfer pause and batch transfers.
 *
 * Input starts with a little endian instruction code followed by the
 * instruction's arguments. Accounts are passed as raw bytes, integers as
 * little endian and sequences are prefixed with a 32-bit length.
 */
struct capped_token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    construct,
    name,
    symbol,
    decimals,
    total_supply,
    max_supply,
    balance_of,
    owner,
    paused,
    transfer,
    mint,
    multisend,
    pause,
    unpause,
    transfer_ownership,
    renounce_ownership
  };

  static constexpr std::uint32_t decimals            = 8;
  static constexpr std::uint32_t max_batch_size      = 1'024;
  static constexpr std::uint32_t max_metadata_length = 128;

  capped_token()                      = default;
  capped_token( const capped_token& ) = delete;
  capped_token( capped_token&& )      = delete;
  ~capped_token() override            = default;

  capped_token& operator=( const capped_token& ) = delete;
  capped_token& operator=( capped_token&& )      = delete;

  std::error_code run( system_interface* system ) override;

private:
  std::error_code construct( system_interface* system );
  std::error_code mint( system_interface* system );
  std::error_code multisend( system_interface* system );
  std::error_code transfer( system_interface* system );

  bool initialized( system_interface* system ) const;
  std::uint64_t max_supply( system_interface* system ) const;

  ledger _ledger;
  ownable _ownable;
  pausable _gate;
};

} // namespace mintcap::program
