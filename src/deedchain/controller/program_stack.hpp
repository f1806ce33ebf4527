#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <deedchain/protocol.hpp>

namespace deedchain::controller {

struct stack_frame
{
  protocol::account caller{};
  std::span< const std::string > arguments;
  std::span< const std::byte > stdin;
  std::size_t input_offset = 0;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

constexpr std::size_t default_stack_limit = 8;

class program_stack final
{
public:
  program_stack( std::size_t stack_limit = default_stack_limit );

  std::error_code push_frame( stack_frame&& f ) noexcept;
  stack_frame& peek_frame();
  stack_frame pop_frame();

  std::size_t size() const;

private:
  std::vector< stack_frame > _stack;
  std::size_t _limit;
};

/**
 * Pops the top frame when leaving scope.
 */
class frame_guard final
{
public:
  frame_guard( program_stack& stack ) noexcept;
  frame_guard( const frame_guard& ) = delete;
  frame_guard( frame_guard&& )      = delete;
  ~frame_guard();

  frame_guard& operator=( const frame_guard& ) = delete;
  frame_guard& operator=( frame_guard&& )      = delete;

private:
  program_stack& _stack;
};

} // namespace deedchain::controller
