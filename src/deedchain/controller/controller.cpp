#include <deedchain/controller/controller.hpp>

#include "execution_context.hpp"

#include <deedchain/log.hpp>

#include <algorithm>
#include <stdexcept>

namespace deedchain::controller {

controller::controller():
    _program( std::make_shared< program::deed_registry >() )
{}

controller::~controller()
{
  close();
}

void controller::open( std::uint64_t genesis_height )
{
  _db.open( {}, genesis_height );

  LOG_INFO( deedchain::log::instance(), "Opened database at height {}", _db.head()->revision() );
}

void controller::close()
{
  _db.close();
}

result< protocol::block_receipt > controller::process( const protocol::block& block )
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  if( !block.validate() )
    return std::unexpected( controller_errc::malformed_block );

  auto head = _db.head();

  if( block.height != head->revision() + 1 )
    return std::unexpected( controller_errc::unexpected_height );

  LOG_DEBUG( deedchain::log::instance(),
             "Pushing block - Height: {} [{} transaction(s)]",
             block.height,
             block.transactions.size() );

  auto block_node = head->make_child();

  execution_context context( _program, intent::block_application );
  context.set_state_node( block_node );

  return context.apply( block ).and_then(
    [ & ]( auto&& receipt ) -> result< protocol::block_receipt >
    {
      block_node->finalize();

      if( auto error = _db.commit( block_node ); error )
        return std::unexpected( error );

      auto reverted = std::ranges::count_if( receipt.transaction_receipts,
                                             []( const protocol::transaction_receipt& r )
                                             {
                                               return r.reverted;
                                             } );

      LOG_INFO( deedchain::log::instance(),
                "Block applied - Height: {} [{} transaction(s), {} reverted]",
                block.height,
                block.transactions.size(),
                reverted );

      return receipt;
    } );
}

state::head controller::head() const
{
  if( !_db.is_open() )
    throw std::runtime_error( "controller is not open" );

  execution_context context( _program );
  context.set_state_node( _db.head() );
  return context.head();
}

result< protocol::program_output > controller::read_program( const protocol::account& caller,
                                                             const protocol::program_input& input ) const
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  execution_context context( _program );
  context.set_state_node( _db.head() );

  return context.run_program( caller, input.stdin, input.arguments );
}

} // namespace deedchain::controller
