#pragma once

#include <mintcap/program/error.hpp>
#include <mintcap/protocol.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace mintcap::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The host services a program may use while it runs. Objects are scoped to
 * the running program; an empty span means the object does not exist.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  /**
   * Reads exactly buffer.size() bytes or fails without consuming input.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual const protocol::account& get_caller() = 0;

  virtual std::error_code event( std::string_view name,
                                 std::span< const std::byte > data,
                                 const std::vector< protocol::account >& impacted ) = 0;
};

} // namespace mintcap::program
