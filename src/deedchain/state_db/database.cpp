#include <deedchain/state_db/database.hpp>

namespace deedchain::state_db {

database::~database()
{
  close();
}

void database::open( const genesis_init_function& init, std::uint64_t revision )
{
  auto delta = std::make_shared< state_delta >();
  delta->set_revision( revision );

  _head = std::make_shared< state_node >( delta );

  if( init )
    init( _head );
}

void database::close()
{
  _head.reset();
}

bool database::is_open() const
{
  return static_cast< bool >( _head );
}

state_node_ptr database::head() const
{
  return _head;
}

std::error_code database::commit( const state_node_ptr& node )
{
  if( !_head )
    return state_db_errc::not_open;

  if( !node || !node->is_child_of( *_head ) )
    return state_db_errc::unknown_parent;

  node->commit();
  _head = node;

  return state_db_errc::ok;
}

} // namespace deedchain::state_db
