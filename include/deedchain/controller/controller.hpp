#pragma once

#include <deedchain/controller/error.hpp>
#include <deedchain/controller/state.hpp>
#include <deedchain/program.hpp>
#include <deedchain/protocol.hpp>
#include <deedchain/state_db.hpp>

#include <cstdint>
#include <memory>

namespace deedchain::controller {

/**
 * The controller owns the state database and the deed registry.
 *
 * Blocks are applied in height order. Each transaction of a block runs in its
 * own child of the block's state node. A transaction that fails is recorded in
 * the receipt as reverted and leaves no trace in state. Once every transaction
 * has run, the block's node becomes the new head.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open( std::uint64_t genesis_height = 0 );
  void close();

  result< protocol::block_receipt > process( const protocol::block& block );

  state::head head() const;

  /**
   * Run a call against head without modifying state.
   */
  result< protocol::program_output > read_program( const protocol::account& caller,
                                                   const protocol::program_input& input = {} ) const;

private:
  state_db::database _db;
  std::shared_ptr< program::program > _program;
};

} // namespace deedchain::controller
