#pragma once

#include <mintcap/state_db/error.hpp>
#include <mintcap/state_db/state_node.hpp>

namespace mintcap::state_db {

/**
 * database owns the root state node. Writes either go straight to the root
 * (genesis) or through temporary children that are squashed into it.
 *
 * database is not thread safe. Calls against it and against its state nodes
 * need to be serialized by the owner.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, running init against the empty root node.
   */
  std::error_code open( genesis_init_function init );

  /**
   * Close the database. Outstanding temporary nodes keep their own view of
   * the state but can no longer reach the root through the database.
   */
  void close();

  bool is_open() const;

  /**
   * Get and return the current "root" node, or an empty pointer when the
   * database is not open.
   */
  permanent_state_node_ptr root() const;

private:
  permanent_state_node_ptr _root;
};

} // namespace mintcap::state_db
