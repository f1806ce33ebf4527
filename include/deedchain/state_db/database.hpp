#pragma once

#include <deedchain/state_db/error.hpp>
#include <deedchain/state_db/state_node.hpp>

#include <cstdint>
#include <system_error>

namespace deedchain::state_db {

/**
 * database owns the root of the state and advances it one node at a time.
 *
 * Writes happen against children of head. A child is made the new head with
 * commit(), which flattens it into the root. Children that are never
 * committed are discarded with their writes.
 *
 * database is not thread safe. The caller serializes access.
 */
class database final
{
public:
  database() noexcept = default;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, running init against the empty root.
   */
  void open( const genesis_init_function& init, std::uint64_t revision = 0 );

  /**
   * Close the database.
   */
  void close();

  bool is_open() const;

  /**
   * Get and return the current "head" node.
   */
  state_node_ptr head() const;

  /**
   * Make node the new head. node must be a child of the current head.
   */
  std::error_code commit( const state_node_ptr& node );

private:
  state_node_ptr _head;
};

} // namespace deedchain::state_db
