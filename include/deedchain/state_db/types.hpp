#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace deedchain::state_db {

class state_node;
class state_delta;

constexpr std::size_t object_space_padding_size = 3;
constexpr std::size_t address_size              = 32;

/**
 * An object space partitions state between programs (address) and between the
 * maps a single program keeps (id).
 */
struct object_space
{
  bool system = false;
  std::array< std::uint8_t, object_space_padding_size > padding{};
  std::array< std::byte, address_size > address{};
  std::uint32_t id = 0;
};

using state_node_ptr        = std::shared_ptr< state_node >;
using genesis_init_function = std::function< void( state_node_ptr& ) >;

} // namespace deedchain::state_db
