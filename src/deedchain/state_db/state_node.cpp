#include <deedchain/state_db/state_node.hpp>

namespace deedchain::state_db {

state_node::state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return _delta->get( make_compound_key( space, key ) );
}

state_node_ptr state_node::make_child()
{
  return std::make_shared< state_node >( _delta->make_child() );
}

void state_node::squash()
{
  _delta->squash();
}

void state_node::commit()
{
  _delta->commit();
}

void state_node::finalize()
{
  _delta->mark_complete();
}

bool state_node::final() const
{
  return _delta->complete();
}

bool state_node::root() const
{
  return _delta->root();
}

bool state_node::is_child_of( const state_node& parent ) const
{
  return _delta->parent() == parent._delta;
}

std::uint64_t state_node::revision() const
{
  return _delta->revision();
}

} // namespace deedchain::state_db
