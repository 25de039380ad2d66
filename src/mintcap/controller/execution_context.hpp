#pragma once

#include <mintcap/controller/error.hpp>
#include <mintcap/controller/state.hpp>
#include <mintcap/program.hpp>
#include <mintcap/protocol.hpp>
#include <mintcap/state_db.hpp>

#include <memory>
#include <span>
#include <vector>

namespace mintcap::controller {

enum class intent : std::uint8_t
{
  read_only,
  call_application
};

/**
 * Hosts a single program invocation against a state node. Writes land in
 * the state node; discarding the node discards them.
 */
class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const std::shared_ptr< program::program >&, intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  /**
   * Runs the program for the call. The returned code is the program's
   * result; events are available through events() afterwards.
   */
  protocol::program_output run( const protocol::call& call );

  const std::vector< protocol::event >& events() const noexcept;

  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;
  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  const protocol::account& get_caller() final;

  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< protocol::account >& impacted ) final;

private:
  state_db::object_space create_object_space( std::uint32_t id ) const;

  std::shared_ptr< program::program > _program;
  state_db::state_node_ptr _state_node;

  const protocol::call* _call = nullptr;
  std::size_t _input_offset   = 0;
  std::vector< std::byte > _stdout;
  std::vector< protocol::event > _events;

  intent _intent;
};

} // namespace mintcap::controller
