#pragma once

#include <deedchain/controller/error.hpp>
#include <deedchain/controller/state.hpp>
#include <deedchain/program.hpp>
#include <deedchain/protocol.hpp>
#include <deedchain/state_db.hpp>

#include "program_stack.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace deedchain::controller {

enum class intent : std::uint8_t
{
  read_only,
  block_application
};

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

  result< protocol::block_receipt > apply( const protocol::block& );
  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  /**
   * Run the program on behalf of caller against the current state node.
   *
   * Errors raised by the program are returned as the output code. Any other
   * error is returned unexpected.
   */
  result< protocol::program_output > run_program( const protocol::account& caller,
                                                  std::span< const std::byte > stdin,
                                                  std::span< const std::string > arguments = {} );

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::span< const std::byte > get_caller() final;
  std::uint64_t get_height() final;

  void log( std::string_view message ) final;

  state::head head() const;

private:
  state_db::object_space create_object_space( std::uint32_t id ) const;

  std::shared_ptr< program::program > _program;
  state_db::state_node_ptr _state_node;
  program_stack _stack;

  const protocol::block* _block = nullptr;

  std::vector< std::string > _logs;
  intent _intent;
};

} // namespace deedchain::controller
