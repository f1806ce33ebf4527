#include "program_stack.hpp"

#include <deedchain/controller/error.hpp>

#include <stdexcept>

namespace deedchain::controller {

program_stack::program_stack( std::size_t stack_limit ):
    _stack(),
    _limit( stack_limit )
{}

std::error_code program_stack::push_frame( stack_frame&& f ) noexcept
{
  if( _stack.size() >= _limit )
    return reversion_errc::stack_overflow;

  _stack.emplace_back( std::move( f ) );

  return reversion_errc::ok;
}

stack_frame& program_stack::peek_frame()
{
  if( _stack.size() == 0 )
    throw std::runtime_error( "stack is empty" );

  return *_stack.rbegin();
}

stack_frame program_stack::pop_frame()
{
  if( _stack.size() == 0 )
    throw std::runtime_error( "stack is empty" );

  stack_frame frame = std::move( *_stack.rbegin() );
  _stack.pop_back();

  return frame;
}

std::size_t program_stack::size() const
{
  return _stack.size();
}

frame_guard::frame_guard( program_stack& stack ) noexcept:
    _stack( stack )
{}

frame_guard::~frame_guard()
{
  if( _stack.size() )
    _stack.pop_frame();
}

} // namespace deedchain::controller
