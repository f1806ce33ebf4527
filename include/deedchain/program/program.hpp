#pragma once

#include <span>
#include <string>
#include <system_error>

#include <deedchain/program/system_interface.hpp>
#include <deedchain/protocol/account.hpp>

namespace deedchain::program {

/**
 * A program owns the objects stored under its account and is driven through a
 * system_interface.
 */
struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual const protocol::account& id() const noexcept = 0;

  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace deedchain::program
