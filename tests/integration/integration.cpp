// NOLINTBEGIN

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <deedchain/controller.hpp>
#include <deedchain/log.hpp>
#include <deedchain/program.hpp>
#include <deedchain/protocol.hpp>
#include <test/fixture.hpp>

using deedchain::program::instruction;
using deedchain::program::program_errc;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" ),
      alice( deedchain::protocol::system_account( "alice" ) ),
      bob( deedchain::protocol::system_account( "bob" ) ),
      carol( deedchain::protocol::system_account( "carol" ) )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  deedchain::protocol::transaction register_property( const deedchain::protocol::account& caller,
                                                      const deedchain::protocol::account& owner,
                                                      const std::string& title )
  {
    deedchain::protocol::register_arguments args;
    args.title         = title;
    args.description   = "Two storey house with garden";
    args.location      = "12 Elm Street";
    args.category      = "residential";
    args.area          = 2'400;
    args.unit          = "sqft";
    args.initial_owner = owner;

    return make_transaction( caller, make_stdin( instruction::register_property, args ) );
  }

  deedchain::protocol::transaction transfer( const deedchain::protocol::account& caller,
                                             std::uint64_t property_id,
                                             const deedchain::protocol::account& new_owner )
  {
    deedchain::protocol::transfer_arguments args;
    args.property_id = property_id;
    args.new_owner   = new_owner;
    args.reason      = "sale";
    args.amount      = 350'000;

    return make_transaction( caller, make_stdin( instruction::transfer, args ) );
  }

  template< typename T, typename Args >
  T query( instruction i, const Args& args )
  {
    auto response = _controller->read_program( alice, make_input( make_stdin( i, args ) ) );
    if( !response )
      throw std::runtime_error( response.error().message() );

    if( response->code )
      throw std::runtime_error( "query failed with code " + std::to_string( response->code ) );

    return read_output< T >( *response );
  }

  deedchain::protocol::system_statistics statistics()
  {
    auto response =
      _controller->read_program( alice, make_input( make_stdin( instruction::get_system_statistics ) ) );
    if( !response || response->code )
      throw std::runtime_error( "statistics query failed" );

    return read_output< deedchain::protocol::system_statistics >( *response );
  }

  deedchain::protocol::account alice;
  deedchain::protocol::account bob;
  deedchain::protocol::account carol;
};

TEST_F( integration, property_lifecycle )
{
  auto receipt = _controller->process( make_block( register_property( alice, alice, "Elm Street house" ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head | test::fixture::verification::without_reversion ) );
  ASSERT_EQ( receipt->transaction_receipts.size(), 1 );
  EXPECT_EQ( read_output< std::uint64_t >( receipt->transaction_receipts[ 0 ].output ), 1 );
  EXPECT_EQ( receipt->transaction_receipts[ 0 ].logs, std::vector< std::string >{ "registered property 1" } );

  deedchain::protocol::verify_arguments verify_args;
  verify_args.property_id = 1;
  verify_args.notes       = "Title search complete";

  deedchain::protocol::change_status_arguments status_args;
  status_args.property_id = 1;
  status_args.new_status  = deedchain::protocol::property_status::pending;
  status_args.reason      = "sale in progress";

  receipt = _controller->process(
    make_block( make_transaction( carol, make_stdin( instruction::verify, verify_args ) ),
                make_transaction( alice, make_stdin( instruction::change_status, status_args ) ),
                transfer( alice, 1, bob ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head | test::fixture::verification::without_reversion ) );
  EXPECT_EQ( _controller->head().height, 2 );

  deedchain::protocol::add_document_arguments document_args;
  document_args.property_id = 1;
  document_args.title       = "Deed of sale";
  document_args.type        = "pdf";
  document_args.hash        = "2c26b46b68ffc68ff99b453c1d30413413422d706483bfa0f98a5e886266e7ae";

  deedchain::protocol::grant_arguments grant_args;
  grant_args.property_id = 1;
  grant_args.accessor    = carol;
  grant_args.level       = 2;
  grant_args.expiry      = 5;

  receipt = _controller->process(
    make_block( make_transaction( bob, make_stdin( instruction::add_document, document_args ) ),
                make_transaction( bob, make_stdin( instruction::grant_access, grant_args ) ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head | test::fixture::verification::without_reversion ) );
  EXPECT_EQ( read_output< std::uint64_t >( receipt->transaction_receipts[ 0 ].output ), 1 );

  deedchain::protocol::property_arguments property;
  property.property_id = 1;

  EXPECT_EQ( query< deedchain::protocol::account >( instruction::get_owner, property ), bob );

  auto info = query< deedchain::protocol::property_info >( instruction::get_property_info, property );
  EXPECT_EQ( info.owner, bob );
  EXPECT_EQ( info.metadata.title, "Elm Street house" );
  EXPECT_EQ( info.metadata.status, deedchain::protocol::property_status::pending );
  EXPECT_EQ( info.metadata.registered_at, 1 );
  EXPECT_EQ( info.metadata.last_modified, 3 );
  EXPECT_TRUE( info.verification.verified );
  EXPECT_EQ( info.verification.verifier, carol );
  EXPECT_EQ( info.verification.timestamp, 2 );

  deedchain::protocol::property_sequence_arguments sequence;
  sequence.property_id = 1;
  sequence.sequence    = 1;

  auto record = query< deedchain::protocol::transfer_record >( instruction::get_transfer, sequence );
  EXPECT_EQ( record.from, alice );
  EXPECT_EQ( record.to, bob );
  EXPECT_EQ( record.timestamp, 2 );
  EXPECT_EQ( record.amount, std::optional< std::uint64_t >( 350'000 ) );

  auto document = query< deedchain::protocol::document_record >( instruction::get_document, sequence );
  EXPECT_EQ( document.uploader, bob );
  EXPECT_EQ( document.timestamp, 3 );

  auto history =
    query< std::vector< deedchain::protocol::status_change_record > >( instruction::get_status_history, property );
  ASSERT_EQ( history.size(), 1 );
  EXPECT_EQ( history[ 0 ].actor, alice );
  EXPECT_EQ( history[ 0 ].new_status, deedchain::protocol::property_status::pending );

  deedchain::protocol::property_account_arguments membership;
  membership.property_id = 1;
  membership.account_id  = alice;
  EXPECT_FALSE( query< bool >( instruction::get_owner_membership, membership ) );

  membership.account_id = bob;
  EXPECT_TRUE( query< bool >( instruction::get_owner_membership, membership ) );
  EXPECT_TRUE( query< bool >( instruction::owns_property, membership ) );

  deedchain::protocol::check_access_arguments access;
  access.property_id    = 1;
  access.accessor       = carol;
  access.required_level = 2;
  EXPECT_TRUE( query< bool >( instruction::check_access, access ) );

  access.required_level = 3;
  EXPECT_FALSE( query< bool >( instruction::check_access, access ) );

  auto counters = query< deedchain::protocol::property_counters >( instruction::get_property_counters, property );
  EXPECT_EQ( counters.transfers, 1 );
  EXPECT_EQ( counters.documents, 1 );
  EXPECT_EQ( counters.status_changes, 1 );

  auto stats = statistics();
  EXPECT_EQ( stats.total_properties, 1 );
  EXPECT_EQ( stats.total_transfers, 1 );
  EXPECT_EQ( stats.total_verified, 1 );
  EXPECT_EQ( stats.height, 3 );

  // The grant expires at height 5.
  ASSERT_TRUE( verify( _controller->process( make_block() ), test::fixture::verification::head ) );
  ASSERT_TRUE( verify( _controller->process( make_block() ), test::fixture::verification::head ) );

  access.required_level = 2;
  EXPECT_TRUE( query< bool >( instruction::check_access, access ) );

  ASSERT_TRUE( verify( _controller->process( make_block() ), test::fixture::verification::head ) );
  EXPECT_FALSE( query< bool >( instruction::check_access, access ) );
}

TEST_F( integration, reverted_transactions )
{
  auto receipt = _controller->process( make_block( register_property( alice, alice, "Lot 1" ),
                                                   transfer( bob, 1, carol ),
                                                   register_property( bob, bob, "Lot 2" ),
                                                   transfer( alice, 1, alice ),
                                                   register_property( bob, bob, "" ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::head ) );
  ASSERT_EQ( receipt->transaction_receipts.size(), 5 );

  const auto& receipts = receipt->transaction_receipts;

  EXPECT_FALSE( receipts[ 0 ].reverted );
  EXPECT_EQ( read_output< std::uint64_t >( receipts[ 0 ].output ), 1 );

  EXPECT_TRUE( receipts[ 1 ].reverted );
  EXPECT_EQ( receipts[ 1 ].output.code, std::to_underlying( program_errc::unauthorized ) );
  EXPECT_TRUE( receipts[ 1 ].output.stdout.empty() );
  ASSERT_FALSE( receipts[ 1 ].logs.empty() );
  EXPECT_EQ( receipts[ 1 ].logs.back(), "transaction reverted: unauthorized" );

  EXPECT_FALSE( receipts[ 2 ].reverted );
  EXPECT_EQ( read_output< std::uint64_t >( receipts[ 2 ].output ), 2 );

  EXPECT_TRUE( receipts[ 3 ].reverted );
  EXPECT_EQ( receipts[ 3 ].output.code, std::to_underlying( program_errc::invalid_owner ) );

  EXPECT_TRUE( receipts[ 4 ].reverted );
  EXPECT_EQ( receipts[ 4 ].output.code, std::to_underlying( program_errc::invalid_property_data ) );

  deedchain::protocol::property_arguments property;
  property.property_id = 1;
  EXPECT_EQ( query< deedchain::protocol::account >( instruction::get_owner, property ), alice );

  auto stats = statistics();
  EXPECT_EQ( stats.total_properties, 2 );
  EXPECT_EQ( stats.total_transfers, 0 );

  receipt = _controller->process(
    make_block( make_transaction( alice, make_stdin( static_cast< instruction >( 99 ), property ) ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::head ) );
  EXPECT_TRUE( receipt->transaction_receipts[ 0 ].reverted );
  EXPECT_EQ( receipt->transaction_receipts[ 0 ].output.code, std::to_underlying( program_errc::invalid_instruction ) );
}

TEST_F( integration, truncated_calls )
{
  auto truncated = register_property( alice, alice, "Lot 1" );
  truncated.input.stdin.resize( truncated.input.stdin.size() - 29 );

  auto header_only = register_property( alice, alice, "Lot 2" );
  header_only.input.stdin.resize( 6 );

  auto receipt = _controller->process(
    make_block( std::move( truncated ), std::move( header_only ), register_property( bob, bob, "Lot 3" ) ) );

  ASSERT_TRUE( verify( receipt, test::fixture::verification::head ) );
  ASSERT_EQ( receipt->transaction_receipts.size(), 3 );

  const auto& receipts = receipt->transaction_receipts;

  EXPECT_TRUE( receipts[ 0 ].reverted );
  EXPECT_EQ( receipts[ 0 ].output.code, std::to_underlying( program_errc::invalid_instruction ) );
  EXPECT_TRUE( receipts[ 0 ].output.stdout.empty() );

  EXPECT_TRUE( receipts[ 1 ].reverted );
  EXPECT_EQ( receipts[ 1 ].output.code, std::to_underlying( program_errc::invalid_instruction ) );

  EXPECT_FALSE( receipts[ 2 ].reverted );
  EXPECT_EQ( read_output< std::uint64_t >( receipts[ 2 ].output ), 1 );

  deedchain::protocol::property_arguments property;
  property.property_id = 1;
  EXPECT_EQ( query< deedchain::protocol::account >( instruction::get_owner, property ), bob );
  EXPECT_EQ( statistics().total_properties, 1 );

  auto response = _controller->read_program( alice, make_input( std::vector< std::byte >( 3 ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( response->code, std::to_underlying( program_errc::invalid_instruction ) );
}

TEST_F( integration, read_only_calls )
{
  auto response = _controller->read_program(
    alice,
    make_input( register_property( alice, alice, "Lot 1" ).input.stdin ) );

  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( response->code, std::to_underlying( program_errc::read_only_context ) );
  EXPECT_TRUE( response->stdout.empty() );

  EXPECT_EQ( statistics().total_properties, 0 );

  deedchain::protocol::property_arguments property;
  property.property_id = 1;

  response = _controller->read_program( alice, make_input( make_stdin( instruction::get_owner, property ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( response->code, std::to_underlying( program_errc::property_not_found ) );

  response = _controller->read_program( alice, make_input( make_stdin( instruction::get_property_count ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( response->code, 0 );
  EXPECT_EQ( read_output< std::uint64_t >( *response ), 0 );
}

TEST_F( integration, block_validation )
{
  auto receipt = _controller->process( make_block( 5, register_property( alice, alice, "Lot 1" ) ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::unexpected_height );
  EXPECT_EQ( _controller->head().height, 0 );

  receipt = _controller->process( make_block( register_property( {}, alice, "Lot 1" ) ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::malformed_block );

  auto empty_input  = register_property( alice, alice, "Lot 1" );
  empty_input.input = {};
  receipt           = _controller->process( make_block( empty_input ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::malformed_block );

  EXPECT_EQ( _controller->head().height, 0 );
  EXPECT_EQ( statistics().total_properties, 0 );

  ASSERT_TRUE( verify( _controller->process( make_block( register_property( alice, alice, "Lot 1" ) ) ),
                       test::fixture::verification::head | test::fixture::verification::without_reversion ) );

  receipt = _controller->process( make_block( 1 ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::unexpected_height );

  _controller->close();

  receipt = _controller->process( make_block( 2 ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::not_open );

  auto response = _controller->read_program( alice );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), deedchain::controller::controller_errc::not_open );
}

TEST_F( integration, end_to_end )
{
  deedchain::protocol::register_arguments registration;
  registration.title         = "Lot 7";
  registration.description   = "Vacant lot";
  registration.location      = "Springfield";
  registration.category      = "land";
  registration.area          = 1'000;
  registration.unit          = "sqft";
  registration.initial_owner = alice;

  auto receipt =
    _controller->process( make_block( make_transaction( alice, make_stdin( instruction::register_property, registration ) ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head | test::fixture::verification::without_reversion ) );
  EXPECT_EQ( read_output< std::uint64_t >( receipt->transaction_receipts[ 0 ].output ), 1 );

  deedchain::protocol::transfer_arguments transfer_args;
  transfer_args.property_id = 1;
  transfer_args.new_owner   = bob;
  transfer_args.reason      = "sale";
  transfer_args.amount      = 500;

  deedchain::protocol::change_status_arguments status_args;
  status_args.property_id = 1;
  status_args.new_status  = deedchain::protocol::property_status::suspended;
  status_args.reason      = "dispute";

  receipt = _controller->process(
    make_block( make_transaction( alice, make_stdin( instruction::transfer, transfer_args ) ),
                make_transaction( carol, make_stdin( instruction::change_status, status_args ) ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head | test::fixture::verification::without_reversion ) );

  deedchain::protocol::property_arguments property;
  property.property_id = 1;
  EXPECT_EQ( query< deedchain::protocol::account >( instruction::get_owner, property ), bob );

  deedchain::protocol::property_sequence_arguments sequence;
  sequence.property_id = 1;
  sequence.sequence    = 1;

  auto record = query< deedchain::protocol::transfer_record >( instruction::get_transfer, sequence );
  EXPECT_EQ( record.from, alice );
  EXPECT_EQ( record.to, bob );
  EXPECT_EQ( record.amount, std::optional< std::uint64_t >( 500 ) );

  auto info = query< deedchain::protocol::property_info >( instruction::get_property_info, property );
  EXPECT_EQ( info.metadata.status, deedchain::protocol::property_status::suspended );
}

class genesis: public ::testing::Test,
               public test::fixture
{
public:
  genesis():
      test::fixture( "genesis", "info", 10 )
  {}
};

TEST_F( genesis, height )
{
  EXPECT_EQ( _controller->head().height, 10 );

  auto receipt = _controller->process( make_block( 1 ) );
  ASSERT_FALSE( receipt.has_value() );
  EXPECT_EQ( receipt.error(), deedchain::controller::controller_errc::unexpected_height );

  receipt = _controller->process( make_block() );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head ) );
  EXPECT_EQ( receipt->height, 11 );
  EXPECT_EQ( _controller->head().height, 11 );
}

// NOLINTEND
