#pragma once

#include <cstdint>

#include <deedchain/protocol.hpp>
#include <deedchain/state_db.hpp>

namespace deedchain::controller { namespace state {

/**
 * The object space of a program's object id.
 */
state_db::object_space program_space( const protocol::account& program, std::uint32_t id );

struct head
{
  std::uint64_t height = 0;
};

}} // namespace deedchain::controller::state
