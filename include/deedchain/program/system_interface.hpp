#pragma once

#include <deedchain/program/error.hpp>
#include <deedchain/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace deedchain::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The environment a program runs in.
 *
 * Objects are addressed by an object id and a key, scoped to the running
 * program. A span returned by get_object is valid until the next write.
 *
 * A read fills the whole buffer. When less input remains it consumes nothing
 * and fails with program_errc::invalid_instruction.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::span< const std::byte > get_caller() = 0;
  virtual std::uint64_t get_height()                = 0;

  virtual void log( std::string_view message ) = 0;
};

} // namespace deedchain::program
