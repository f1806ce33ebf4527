#pragma once

#include <deedchain/memory.hpp>
#include <deedchain/state_db/state_delta.hpp>
#include <deedchain/state_db/types.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>

namespace deedchain::state_db {

inline std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

class state_node final
{
public:
  state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  ~state_node()                        = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  /**
   * Fetch an object if one exists.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  /**
   * Write an object into the state_node.
   */
  template< std::ranges::range ValueType >
  std::int64_t put( const object_space& space, std::span< const std::byte > key, const ValueType& value )
  {
    return _delta->put( make_compound_key( space, key ), value );
  }

  /**
   * Returns a child state node with this node as its parent.
   */
  state_node_ptr make_child();

  /**
   * Merge the contents of this node into its parent.
   */
  void squash();

  /**
   * Write this node and all of its ancestors into a single root node.
   */
  void commit();

  /**
   * Prevent further writes to this node.
   */
  void finalize();
  bool final() const;

  bool root() const;
  bool is_child_of( const state_node& parent ) const;

  /**
   * Returns the revision of the state node.
   */
  std::uint64_t revision() const;

private:
  std::shared_ptr< state_delta > _delta;
};

} // namespace deedchain::state_db
