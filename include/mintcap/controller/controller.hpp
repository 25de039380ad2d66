#pragma once

#include <mintcap/controller/error.hpp>
#include <mintcap/controller/state.hpp>
#include <mintcap/program.hpp>
#include <mintcap/protocol.hpp>
#include <mintcap/state_db.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace mintcap::controller {

class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Creates the state and constructs the token as the genesis deployer.
   * Throws std::system_error when construction is rejected.
   */
  void open( const state::genesis_data& data );
  void close();

  result< protocol::call_receipt > process( const protocol::call& call );
  result< protocol::program_output > read( const protocol::call& call ) const;

  std::uint64_t revision() const;

private:
  state_db::database _db;
  std::shared_ptr< program::program > _program;
};

/**
 * Encodes the construct instruction for the given genesis data.
 */
std::vector< std::byte > make_construct_input( const state::genesis_data& data );

} // namespace mintcap::controller
