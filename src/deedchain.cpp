#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/endian.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <deedchain/controller.hpp>
#include <deedchain/encode.hpp>
#include <deedchain/log.hpp>
#include <deedchain/memory.hpp>
#include <deedchain/program.hpp>
#include <deedchain/protocol.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service_name = "deedchain"s;

constexpr auto help_option            = "help,h"s;
constexpr auto version_option         = "version,v"s;
constexpr auto basedir_option         = "basedir,d"s;
constexpr auto basedir_default        = ".deedchain"s;
constexpr auto log_level_option       = "log-level,l"s;
constexpr auto log_level_default      = "info"s;
constexpr auto genesis_height_option  = "genesis-height,g"s;
constexpr auto genesis_height_default = 0ul;
constexpr auto script_option          = "script,s"s;
constexpr auto script_default         = ""s;

} // namespace constants

using namespace boost;
using namespace deedchain;

namespace {

const std::string& version_string()
{
  static std::string v_str = "Deedchain v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                             + std::to_string( PROJECT_MINOR_VERSION ) + "."
                             + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}

/**
 * Resolve an option from the command line, then the service section of the
 * config, then the global section, falling back to the default.
 */
template< typename T >
T get_option( std::string key,
              T default_value,
              const program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  if( auto pos = key.find( ',' ); pos != std::string::npos )
    key.erase( pos );

  if( cli_args.count( key ) )
    return cli_args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

protocol::account to_account( const std::string& value )
{
  auto account = encode::from_account_string( value );
  if( !account )
    throw std::runtime_error( "invalid account '" + value + "': " + account.error().message() );

  return *account;
}

protocol::property_status to_status( const YAML::Node& node )
{
  auto name = node.as< std::string >();

  if( name == "active" )
    return protocol::property_status::active;
  if( name == "pending" )
    return protocol::property_status::pending;
  if( name == "suspended" )
    return protocol::property_status::suspended;
  if( name == "archived" )
    return protocol::property_status::archived;

  throw std::runtime_error( "invalid property status '" + name + "'" );
}

std::uint8_t to_access_level( std::uint64_t value )
{
  if( auto level = program::to_access_level( value ); level )
    return *level;

  throw std::runtime_error( "invalid access level " + std::to_string( value ) );
}

template< typename T >
std::optional< T > optional_field( const YAML::Node& node, const std::string& key )
{
  if( node[ key ] )
    return node[ key ].as< T >();

  return {};
}

template< typename T >
T field( const YAML::Node& node, const std::string& key, T default_value = {} )
{
  return optional_field< T >( node, key ).value_or( std::move( default_value ) );
}

void append_stdin( std::vector< std::byte >& input, std::uint32_t value )
{
  boost::endian::native_to_little_inplace( value );
  auto bytes = memory::as_bytes( value );
  input.insert( input.end(), bytes.begin(), bytes.end() );
}

template< typename T >
std::vector< std::byte > make_call( program::instruction i, const T& args )
{
  auto payload = protocol::to_binary( args );

  std::vector< std::byte > input;
  append_stdin( input, std::to_underlying( i ) );
  append_stdin( input, static_cast< std::uint32_t >( payload.size() ) );
  input.insert( input.end(), payload.begin(), payload.end() );
  return input;
}

std::vector< std::byte > make_call( program::instruction i )
{
  std::vector< std::byte > input;
  append_stdin( input, std::to_underlying( i ) );
  return input;
}

std::vector< std::byte > make_call( program::instruction i, const YAML::Node& node )
{
  using program::instruction;

  switch( i )
  {
    case instruction::register_property:
      {
        protocol::register_arguments args;
        args.title         = field< std::string >( node, "title" );
        args.description   = field< std::string >( node, "description" );
        args.location      = field< std::string >( node, "location" );
        args.category      = field< std::string >( node, "category" );
        args.area          = field< std::uint64_t >( node, "area" );
        args.unit          = field< std::string >( node, "unit" );
        args.initial_owner = to_account( field< std::string >( node, "initial_owner" ) );
        return make_call( i, args );
      }
    case instruction::update_metadata:
      {
        protocol::update_metadata_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.title       = field< std::string >( node, "title" );
        args.description = field< std::string >( node, "description" );
        args.location    = field< std::string >( node, "location" );
        args.category    = field< std::string >( node, "category" );
        args.area        = field< std::uint64_t >( node, "area" );
        args.unit        = field< std::string >( node, "unit" );
        return make_call( i, args );
      }
    case instruction::transfer:
      {
        protocol::transfer_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.new_owner   = to_account( field< std::string >( node, "new_owner" ) );
        args.reason      = field< std::string >( node, "reason" );
        args.amount      = optional_field< std::uint64_t >( node, "amount" );
        return make_call( i, args );
      }
    case instruction::verify:
      {
        protocol::verify_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.notes       = field< std::string >( node, "notes" );
        return make_call( i, args );
      }
    case instruction::add_document:
      {
        protocol::add_document_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.title       = field< std::string >( node, "title" );
        args.type        = field< std::string >( node, "type" );
        args.hash        = field< std::string >( node, "hash" );
        args.description = field< std::string >( node, "description" );
        return make_call( i, args );
      }
    case instruction::change_status:
      {
        protocol::change_status_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.new_status  = to_status( node[ "new_status" ] );
        args.reason      = field< std::string >( node, "reason" );
        return make_call( i, args );
      }
    case instruction::grant_access:
      {
        protocol::grant_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.accessor    = to_account( field< std::string >( node, "accessor" ) );
        args.level       = to_access_level( field< std::uint64_t >( node, "level" ) );
        args.expiry      = optional_field< std::uint64_t >( node, "expiry" );
        return make_call( i, args );
      }
    case instruction::check_access:
      {
        protocol::check_access_arguments args;
        args.property_id    = field< std::uint64_t >( node, "property_id" );
        args.accessor       = to_account( field< std::string >( node, "accessor" ) );
        args.required_level = to_access_level( field< std::uint64_t >( node, "required_level" ) );
        return make_call( i, args );
      }
    case instruction::revoke_access:
    case instruction::owns_property:
    case instruction::get_owner_membership:
    case instruction::get_access_grant:
      {
        protocol::property_account_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.account_id  = to_account( field< std::string >( node, "account" ) );
        return make_call( i, args );
      }
    case instruction::get_document:
    case instruction::get_transfer:
    case instruction::get_status_change:
      {
        protocol::property_sequence_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        args.sequence    = field< std::uint64_t >( node, "sequence" );
        return make_call( i, args );
      }
    case instruction::get_property_info:
    case instruction::get_owner:
    case instruction::get_verification:
    case instruction::get_status_history:
    case instruction::get_property_counters:
      {
        protocol::property_arguments args;
        args.property_id = field< std::uint64_t >( node, "property_id" );
        return make_call( i, args );
      }
    case instruction::get_property_count:
    case instruction::get_system_statistics:
      return make_call( i );
  }

  std::unreachable();
}

protocol::block make_block( const YAML::Node& node, std::uint64_t height )
{
  protocol::block block;
  block.height = field< std::uint64_t >( node, "height", height );

  for( const auto& tx_node: node[ "transactions" ] )
  {
    auto operation   = field< std::string >( tx_node, "operation" );
    auto instruction = program::to_instruction( operation );
    if( !instruction )
      throw std::runtime_error( "unknown operation '" + operation + "'" );

    protocol::transaction transaction;
    transaction.caller      = to_account( field< std::string >( tx_node, "caller" ) );
    transaction.input.stdin = make_call( *instruction, tx_node );
    block.transactions.emplace_back( std::move( transaction ) );
  }

  return block;
}

std::string_view instruction_name( const protocol::transaction& transaction )
{
  std::uint32_t value = 0;
  std::span< const std::byte > input( transaction.input.stdin );

  if( input.size() < sizeof( value ) )
    return "unknown";

  std::ranges::copy( input.first( sizeof( value ) ), memory::as_writable_bytes( value ).begin() );
  boost::endian::little_to_native_inplace( value );

  return program::to_string( static_cast< program::instruction >( value ) );
}

void log_receipt( const protocol::block& block, const protocol::block_receipt& receipt )
{
  for( std::size_t i = 0; i < receipt.transaction_receipts.size(); ++i )
  {
    const auto& tx_receipt = receipt.transaction_receipts[ i ];
    auto name              = instruction_name( block.transactions[ i ] );

    if( tx_receipt.reverted )
      LOG_INFO( deedchain::log::instance(),
                "Height {}: {} from {} reverted with code {}",
                receipt.height,
                name,
                encode::to_account_string( tx_receipt.caller ),
                tx_receipt.output.code );
    else
      LOG_INFO( deedchain::log::instance(),
                "Height {}: {} from {} applied",
                receipt.height,
                name,
                encode::to_account_string( tx_receipt.caller ) );

    for( const auto& message: tx_receipt.logs )
      LOG_DEBUG( deedchain::log::instance(), "  {}", message );
  }
}

int apply_script( controller::controller& controller, const std::filesystem::path& script )
{
  auto root = YAML::LoadFile( script.string() );

  std::size_t applied = 0;

  for( const auto& block_node: root[ "blocks" ] )
  {
    auto block   = make_block( block_node, controller.head().height + 1 );
    auto receipt = controller.process( block );

    if( !receipt )
    {
      LOG_ERROR( deedchain::log::instance(), "Block at height {} was rejected: {}", block.height, receipt.error().message() );
      return EXIT_FAILURE;
    }

    log_receipt( block, *receipt );
    ++applied;
  }

  auto response =
    controller.read_program( protocol::deed_registry_id,
                             protocol::program_input{ .stdin = make_call(
                                                        program::instruction::get_system_statistics ) } );

  if( !response )
  {
    LOG_ERROR( deedchain::log::instance(), "Unable to read system statistics: {}", response.error().message() );
    return EXIT_FAILURE;
  }

  auto statistics = protocol::from_binary< protocol::system_statistics >( response->stdout );

  LOG_INFO( deedchain::log::instance(),
            "Applied {} block(s) - Height: {}, properties: {}, transfers: {}, verified: {}",
            applied,
            statistics.height,
            statistics.total_properties,
            statistics.total_transfers,
            statistics.total_verified );

  return EXIT_SUCCESS;
}

} // namespace

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path script;
  std::uint64_t genesis_height = 0;

  deedchain::log::initialize();

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::version_option.data()       , "Print version string and exit" )
      ( constants::basedir_option.data()       , program_options::value< std::string >()->default_value( constants::basedir_default ), "Deedchain base directory" )
      ( constants::log_level_option.data()     , program_options::value< std::string >()  , "The log filtering level" )
      ( constants::genesis_height_option.data(), program_options::value< std::uint64_t >(), "The height of the genesis state" )
      ( constants::script_option.data()        , program_options::value< std::string >()  , "A YAML file of blocks to apply (absolute path or relative to basedir)" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << "\n";
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      global_config  = config[ "global" ];
      service_config = config[ constants::service_name ];
    }

    // clang-format off
    log_level      = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    genesis_height = get_option< std::uint64_t >( constants::genesis_height_option, constants::genesis_height_default, args, service_config, global_config );
    script         = std::filesystem::path( get_option< std::string >( constants::script_option, constants::script_default, args, service_config, global_config ) );
    // clang-format on

    if( !deedchain::log::set_level( log_level ) )
      throw std::runtime_error( log_level + " is not a valid log level" );

    LOG_INFO( deedchain::log::instance(), "{}", version_string() );

    if( config.IsNull() )
      LOG_WARNING( deedchain::log::instance(), "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( !script.empty() && script.is_relative() )
      script = basedir / script;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( deedchain::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller;

  try
  {
    controller.open( genesis_height );

    if( script.empty() )
      LOG_INFO( deedchain::log::instance(), "No script given, nothing to apply" );
    else
      retcode = apply_script( controller, script );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( deedchain::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  controller.close();

  LOG_INFO( deedchain::log::instance(), "Shut down gracefully" );
  deedchain::log::flush();

  return retcode;
}
