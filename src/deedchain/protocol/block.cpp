#include <deedchain/protocol/block.hpp>

#include <algorithm>

namespace deedchain::protocol {

bool block::validate() const noexcept
{
  return std::ranges::all_of( transactions,
                              []( const transaction& t )
                              {
                                return t.validate();
                              } );
}

} // namespace deedchain::protocol
