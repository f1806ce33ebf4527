#include <deedchain/protocol/transaction.hpp>

#include <algorithm>
#include <cstdint>

namespace deedchain::protocol {

bool transaction::validate() const noexcept
{
  if( std::ranges::all_of( caller,
                           []( std::byte elem )
                           {
                             return elem == std::byte{ 0x00 };
                           } ) )
    return false;

  if( input.stdin.size() < sizeof( std::uint32_t ) )
    return false;

  return true;
}

} // namespace deedchain::protocol
