// NOLINTBEGIN

#include <test/fixture.hpp>

#include <deedchain/controller.hpp>
#include <deedchain/log.hpp>
#include <deedchain/protocol.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level, std::uint64_t genesis_height )
{
  deedchain::log::initialize();
  deedchain::log::set_level( log_level );

  LOG_INFO( deedchain::log::instance(), "Starting fixture: {}", name );

  _controller = std::make_unique< deedchain::controller::controller >();
  _controller->open( genesis_height );
}

fixture::~fixture()
{
  _controller->close();
}

deedchain::protocol::transaction fixture::make_transaction( const deedchain::protocol::account& caller,
                                                            std::vector< std::byte >&& stdin ) const
{
  deedchain::protocol::transaction t;
  t.caller      = caller;
  t.input.stdin = std::move( stdin );
  return t;
}

bool fixture::verify( deedchain::controller::result< deedchain::protocol::block_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( deedchain::log::instance(), "Block submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::head )
  {
    auto head = _controller->head();
    if( receipt->height != head.height )
    {
      LOG_ERROR( deedchain::log::instance(),
                 "Block height {} does not match head {}",
                 receipt->height,
                 head.height );
      return false;
    }
  }

  if( flags & verification::without_reversion )
  {
    for( const auto& tx_receipt: receipt->transaction_receipts )
    {
      if( tx_receipt.reverted )
      {
        LOG_ERROR( deedchain::log::instance(),
                   "Transaction from {} was reverted with code {}",
                   deedchain::log::hex{ tx_receipt.caller.data(), tx_receipt.caller.size() },
                   tx_receipt.output.code );
        return false;
      }
    }
  }

  return true;
}

deedchain::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                        std::vector< std::string >&& arguments ) const noexcept
{
  deedchain::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

} // namespace test

// NOLINTEND
