#pragma once

#include <deedchain/state_db/backends/backend.hpp>
#include <deedchain/state_db/types.hpp>

#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <vector>

namespace deedchain::state_db {

/**
 * A state_delta records the writes made on top of its parent.
 *
 * Reads fall through to the parent unless the key was written in this
 * delta. A delta without a parent is the root and holds the full state.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;

  std::shared_ptr< backends::abstract_backend > _backend;

  bool _complete = false;

public:
  state_delta() noexcept;
  state_delta( const state_delta& ) = delete;
  state_delta( state_delta&& )      = delete;
  ~state_delta()                    = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  void squash();
  void commit();

  bool root() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  bool complete() const;
  void mark_complete();

  std::shared_ptr< state_delta > parent() const;
  std::shared_ptr< state_delta > make_child();
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  if( complete() )
    throw std::runtime_error( "cannot modify a complete state delta" );

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _backend->put( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace deedchain::state_db
