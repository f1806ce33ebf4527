#include <deedchain/controller/state.hpp>

#include <algorithm>

namespace deedchain::controller::state {

state_db::object_space program_space( const protocol::account& program, std::uint32_t id )
{
  state_db::object_space space{ .system = false, .id = id };
  std::ranges::copy( program, space.address.begin() );
  return space;
}

} // namespace deedchain::controller::state
