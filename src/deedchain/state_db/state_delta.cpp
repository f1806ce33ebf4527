#include <deedchain/state_db/state_delta.hpp>

#include <deedchain/state_db/backends/map/map_backend.hpp>

#include <algorithm>

namespace deedchain::state_db {

state_delta::state_delta() noexcept:
    _backend( std::make_shared< backends::map::map_backend >() )
{}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  if( auto value = _backend->get( key ); value )
    return value;

  if( root() )
    return {};

  return _parent->get( key );
}

void state_delta::squash()
{
  if( root() )
    return;

  if( _parent->complete() )
    throw std::runtime_error( "cannot squash into a complete state delta" );

  _backend->drain(
    [ this ]( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
    {
      _parent->_backend->put( std::move( key ), std::move( value ) );
    } );
}

void state_delta::commit()
{
  /**
   * commit first walks up to the root delta and takes its backend. It then
   * replays every delta on the path, oldest first, into that backend. The
   * result is this delta becomes the new root and holds the full state.
   */
  if( root() )
    throw std::runtime_error( "cannot commit root" );

  std::vector< std::shared_ptr< state_delta > > node_stack;
  auto current_node = shared_from_this();

  while( current_node )
  {
    node_stack.push_back( current_node );
    current_node = current_node->_parent;
  }

  auto backend = node_stack.back()->_backend;
  node_stack.back()->_backend.reset();
  node_stack.pop_back();

  while( node_stack.size() )
  {
    auto& node = node_stack.back();

    node->_backend->drain(
      [ &backend ]( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
      {
        backend->put( std::move( key ), std::move( value ) );
      } );

    node_stack.pop_back();
  }

  backend->set_revision( revision() );

  _backend = backend;
  _parent.reset();
}

bool state_delta::root() const
{
  return !_parent;
}

std::uint64_t state_delta::revision() const
{
  return _backend->revision();
}

void state_delta::set_revision( std::uint64_t revision )
{
  _backend->set_revision( revision );
}

bool state_delta::complete() const
{
  return _complete;
}

void state_delta::mark_complete()
{
  _complete = true;
}

std::shared_ptr< state_delta > state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child      = std::make_shared< state_delta >();
  child->_parent  = shared_from_this();
  child->_backend = std::make_shared< backends::map::map_backend >( revision() + 1 );

  return child;
}

} // namespace deedchain::state_db
