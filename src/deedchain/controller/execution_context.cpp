#include "execution_context.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <deedchain/log.hpp>

namespace deedchain::controller {

execution_context::execution_context( const std::shared_ptr< program::program >& program, intent i ):
    _program( program ),
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

result< protocol::block_receipt > execution_context::apply( const protocol::block& block )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  protocol::block_receipt receipt;
  receipt.height = block.height;

  _block = &block;

  for( const auto& transaction: block.transactions )
  {
    auto transaction_receipt = apply( transaction );

    if( !transaction_receipt )
    {
      _block = nullptr;
      return std::unexpected( transaction_receipt.error() );
    }

    receipt.transaction_receipts.emplace_back( std::move( transaction_receipt.value() ) );
  }

  _block = nullptr;

  return receipt;
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  protocol::transaction_receipt receipt;
  receipt.caller = transaction.caller;

  _logs.clear();

  auto block_node       = _state_node;
  auto transaction_node = block_node->make_child();
  _state_node           = transaction_node;

  auto output = run_program( transaction.caller, transaction.input.stdin, transaction.input.arguments );

  _state_node = block_node;

  std::error_code error;

  if( !output )
  {
    if( output.error().category() != reversion_category() )
      return std::unexpected( output.error() );

    error = output.error();
  }
  else
  {
    if( output->code )
      error = program::make_error_code( static_cast< program::program_errc >( output->code ) );

    receipt.output = std::move( *output );
  }

  if( error )
  {
    receipt.reverted    = true;
    receipt.output.code = error.value();
    _logs.emplace_back( "transaction reverted: " + error.message() );

    LOG_DEBUG( deedchain::log::instance(), "Transaction reverted with {}: {}", error.value(), error.message() );
  }
  else
  {
    transaction_node->squash();
  }

  receipt.logs = std::move( _logs );
  _logs.clear();

  return receipt;
}

result< protocol::program_output > execution_context::run_program( const protocol::account& caller,
                                                                   std::span< const std::byte > stdin,
                                                                   std::span< const std::string > arguments )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto error = _stack.push_frame( { .caller = caller, .arguments = arguments, .stdin = stdin } ); error )
    return std::unexpected( error );

  frame_guard guard( _stack );

  auto code = _program->run( this, arguments );

  if( code && code.category() != program::program_category() )
    return std::unexpected( code );

  auto& frame = _stack.peek_frame();

  protocol::program_output output;
  output.code   = code.value();
  output.stdout = std::move( frame.stdout );
  output.stderr = std::move( frame.stderr );

  return output;
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.peek_frame().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.peek_frame().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.peek_frame().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd == program::file_descriptor::stdin )
  {
    auto& frame = _stack.peek_frame();

    if( frame.stdin.size() - frame.input_offset < buffer.size() )
      return program::program_errc::invalid_instruction;

    std::ranges::copy( frame.stdin.subspan( frame.input_offset, buffer.size() ), buffer.begin() );
    frame.input_offset += buffer.size();
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id ) const
{
  return state::program_space( _program->id(), id );
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return program::program_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::span< const std::byte > execution_context::get_caller()
{
  return _stack.peek_frame().caller;
}

std::uint64_t execution_context::get_height()
{
  if( _block )
    return _block->height;

  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  return _state_node->revision();
}

void execution_context::log( std::string_view message )
{
  _logs.emplace_back( message );
}

state::head execution_context::head() const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  return state::head{ .height = _state_node->revision() };
}

} // namespace deedchain::controller
