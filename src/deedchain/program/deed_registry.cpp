#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <utility>

#include <boost/endian.hpp>

#include <deedchain/memory.hpp>
#include <deedchain/program/deed_registry.hpp>
#include <deedchain/protocol.hpp>

namespace deedchain::program {

namespace {

namespace space {

constexpr std::uint32_t metadata         = 0;
constexpr std::uint32_t owner            = 1;
constexpr std::uint32_t membership       = 2;
constexpr std::uint32_t verification     = 3;
constexpr std::uint32_t transfer         = 4;
constexpr std::uint32_t document         = 5;
constexpr std::uint32_t status_change    = 6;
constexpr std::uint32_t access_grant     = 7;
constexpr std::uint32_t global_counter   = 8;
constexpr std::uint32_t property_counter = 9;

} // namespace space

enum class global_sequence : std::uint8_t
{
  properties,
  transfers,
  verified
};

enum class property_sequence : std::uint8_t
{
  transfers,
  documents,
  status_changes
};

constexpr std::uint32_t max_argument_size = 64 * 1'024;

constexpr std::array< std::pair< std::string_view, instruction >, 22 > instruction_names{
  { { "register_property", instruction::register_property },
   { "update_metadata", instruction::update_metadata },
   { "transfer", instruction::transfer },
   { "verify", instruction::verify },
   { "add_document", instruction::add_document },
   { "change_status", instruction::change_status },
   { "grant_access", instruction::grant_access },
   { "revoke_access", instruction::revoke_access },
   { "get_property_info", instruction::get_property_info },
   { "get_owner", instruction::get_owner },
   { "owns_property", instruction::owns_property },
   { "get_owner_membership", instruction::get_owner_membership },
   { "get_verification", instruction::get_verification },
   { "get_document", instruction::get_document },
   { "get_transfer", instruction::get_transfer },
   { "get_status_history", instruction::get_status_history },
   { "get_status_change", instruction::get_status_change },
   { "check_access", instruction::check_access },
   { "get_access_grant", instruction::get_access_grant },
   { "get_property_count", instruction::get_property_count },
   { "get_system_statistics", instruction::get_system_statistics },
   { "get_property_counters", instruction::get_property_counters } }
};

// Keys are big endian so that lexicographic order matches numeric order.
void append_key( std::vector< std::byte >& key, std::uint64_t value )
{
  boost::endian::native_to_big_inplace( value );
  auto bytes = memory::as_bytes( value );
  key.insert( key.end(), bytes.begin(), bytes.end() );
}

void append_key( std::vector< std::byte >& key, const protocol::account& account )
{
  key.insert( key.end(), account.begin(), account.end() );
}

void append_key( std::vector< std::byte >& key, global_sequence sequence )
{
  key.push_back( std::byte{ std::to_underlying( sequence ) } );
}

void append_key( std::vector< std::byte >& key, property_sequence sequence )
{
  key.push_back( std::byte{ std::to_underlying( sequence ) } );
}

template< typename... Parts >
std::vector< std::byte > make_key( const Parts&... parts )
{
  std::vector< std::byte > key;
  ( append_key( key, parts ), ... );
  return key;
}

std::uint64_t get_counter( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( !object.size() )
    return 0;

  auto value = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( value );
  return value;
}

std::error_code
set_counter( system_interface* system, std::uint32_t id, std::span< const std::byte > key, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  return system->put_object( id, key, memory::as_bytes( value ) );
}

result< std::uint64_t > next_sequence( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto value = get_counter( system, id, key ) + 1;

  if( auto error = set_counter( system, id, key, value ); error )
    return std::unexpected( error );

  return value;
}

template< typename T >
std::optional< T > get_record( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( !object.size() )
    return {};

  return protocol::from_binary< T >( object );
}

template< typename T >
std::error_code
put_record( system_interface* system, std::uint32_t id, std::span< const std::byte > key, const T& record )
{
  auto bytes = protocol::to_binary( record );
  return system->put_object( id, key, bytes );
}

std::optional< protocol::account > get_owner_record( system_interface* system, std::uint64_t property_id )
{
  auto object = system->get_object( space::owner, make_key( property_id ) );
  if( object.size() != sizeof( protocol::account ) )
    return {};

  protocol::account owner;
  std::ranges::copy( object, owner.begin() );
  return owner;
}

std::error_code
set_membership( system_interface* system, const protocol::account& owner, std::uint64_t property_id, bool member )
{
  return system->put_object( space::membership, make_key( owner, property_id ), memory::as_bytes( member ) );
}

protocol::account get_caller( system_interface* system )
{
  protocol::account caller{};
  auto bytes = system->get_caller();
  std::ranges::copy( bytes.subspan( 0, std::min( bytes.size(), caller.size() ) ), caller.begin() );
  return caller;
}

bool valid_text( std::string_view text, std::size_t max_length, bool required = true ) noexcept
{
  if( required && text.empty() )
    return false;

  return text.size() <= max_length;
}

bool valid_metadata( std::string_view title,
                     std::string_view description,
                     std::string_view location,
                     std::string_view category,
                     std::uint64_t area,
                     std::string_view unit ) noexcept
{
  return valid_text( title, max_title_length ) && valid_text( description, max_description_length )
         && valid_text( location, max_location_length ) && valid_text( category, max_category_length )
         && valid_text( unit, max_unit_length ) && area > 0;
}

bool valid_status( protocol::property_status status ) noexcept
{
  switch( status )
  {
    case protocol::property_status::active:
    case protocol::property_status::pending:
    case protocol::property_status::suspended:
    case protocol::property_status::archived:
      return true;
  }

  return false;
}

template< typename T >
result< T > read_arguments( system_interface* system )
{
  std::uint32_t length = 0;

  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( length ) ); error )
    return std::unexpected( error );

  boost::endian::little_to_native_inplace( length );

  if( length > max_argument_size )
    return std::unexpected( program_errc::invalid_instruction );

  std::vector< std::byte > payload( length );

  if( auto error = system->read( file_descriptor::stdin, payload ); error )
    return std::unexpected( error );

  try
  {
    return protocol::from_binary< T >( payload );
  }
  catch( const std::exception& )
  {
    return std::unexpected( program_errc::invalid_instruction );
  }
}

template< typename T >
std::error_code write_result( system_interface* system, const result< T >& r )
{
  if( !r )
    return r.error();

  return system->write( file_descriptor::stdout, protocol::to_binary( *r ) );
}

template< typename T >
std::error_code write_value( system_interface* system, const T& value )
{
  return system->write( file_descriptor::stdout, protocol::to_binary( value ) );
}

} // namespace

std::optional< instruction > to_instruction( std::string_view name ) noexcept
{
  for( const auto& [ instruction_name, i ]: instruction_names )
    if( instruction_name == name )
      return i;

  return {};
}

std::string_view to_string( instruction i ) noexcept
{
  for( const auto& [ instruction_name, entry ]: instruction_names )
    if( entry == i )
      return instruction_name;

  return "unknown";
}

std::optional< std::uint8_t > to_access_level( std::uint64_t level ) noexcept
{
  if( level < min_access_level || level > max_access_level )
    return {};

  return static_cast< std::uint8_t >( level );
}

bool transition_allowed( protocol::property_status from, protocol::property_status to ) noexcept
{
  if( !valid_status( to ) )
    return false;

  switch( from )
  {
    case protocol::property_status::active:
      return true;
    case protocol::property_status::pending:
      return to == protocol::property_status::active || to == protocol::property_status::suspended;
    case protocol::property_status::suspended:
      return to == protocol::property_status::active || to == protocol::property_status::archived;
    case protocol::property_status::archived:
      return false;
  }

  return false;
}

result< std::uint64_t > deed_registry::register_property( system_interface* system,
                                                          const protocol::register_arguments& args )
{
  if( !valid_metadata( args.title, args.description, args.location, args.category, args.area, args.unit ) )
    return std::unexpected( program_errc::invalid_property_data );

  auto height = system->get_height();

  auto property_id =
    next_sequence( system, space::global_counter, make_key( global_sequence::properties ) );
  if( !property_id )
    return std::unexpected( property_id.error() );

  protocol::property_metadata metadata{ .title         = args.title,
                                        .description   = args.description,
                                        .location      = args.location,
                                        .category      = args.category,
                                        .area          = args.area,
                                        .unit          = args.unit,
                                        .registered_at = height,
                                        .last_modified = height,
                                        .status        = protocol::property_status::active };

  auto key = make_key( *property_id );

  if( auto error = put_record( system, space::metadata, key, metadata ); error )
    return std::unexpected( error );

  if( auto error = system->put_object( space::owner, key, args.initial_owner ); error )
    return std::unexpected( error );

  if( auto error = set_membership( system, args.initial_owner, *property_id, true ); error )
    return std::unexpected( error );

  if( auto error = put_record( system, space::verification, key, protocol::verification_record{} ); error )
    return std::unexpected( error );

  system->log( "registered property " + std::to_string( *property_id ) );

  return property_id;
}

std::error_code deed_registry::update_metadata( system_interface* system,
                                                const protocol::update_metadata_arguments& args )
{
  auto key      = make_key( args.property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return program_errc::property_not_found;

  if( get_owner_record( system, args.property_id ) != get_caller( system ) )
    return program_errc::unauthorized;

  if( !valid_metadata( args.title, args.description, args.location, args.category, args.area, args.unit ) )
    return program_errc::invalid_property_data;

  metadata->title         = args.title;
  metadata->description   = args.description;
  metadata->location      = args.location;
  metadata->category      = args.category;
  metadata->area          = args.area;
  metadata->unit          = args.unit;
  metadata->last_modified = system->get_height();

  if( auto error = put_record( system, space::metadata, key, *metadata ); error )
    return error;

  system->log( "updated metadata of property " + std::to_string( args.property_id ) );

  return program_errc::ok;
}

std::error_code deed_registry::transfer( system_interface* system, const protocol::transfer_arguments& args )
{
  auto key      = make_key( args.property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return program_errc::property_not_found;

  auto caller = get_caller( system );
  auto owner  = get_owner_record( system, args.property_id );

  if( owner != caller )
    return program_errc::unauthorized;

  if( args.new_owner == caller )
    return program_errc::invalid_owner;

  if( !valid_text( args.reason, max_reason_length, false ) )
    return program_errc::invalid_property_data;

  auto height = system->get_height();

  auto transfer_id =
    next_sequence( system, space::property_counter, make_key( args.property_id, property_sequence::transfers ) );
  if( !transfer_id )
    return transfer_id.error();

  protocol::transfer_record record{ .from      = caller,
                                    .to        = args.new_owner,
                                    .timestamp = height,
                                    .reason    = args.reason,
                                    .amount    = args.amount };

  if( auto error = put_record( system, space::transfer, make_key( args.property_id, *transfer_id ), record ); error )
    return error;

  if( auto error = system->put_object( space::owner, key, args.new_owner ); error )
    return error;

  if( auto error = set_membership( system, caller, args.property_id, false ); error )
    return error;

  if( auto error = set_membership( system, args.new_owner, args.property_id, true ); error )
    return error;

  metadata->last_modified = height;

  if( auto error = put_record( system, space::metadata, key, *metadata ); error )
    return error;

  if( auto total = next_sequence( system, space::global_counter, make_key( global_sequence::transfers ) ); !total )
    return total.error();

  system->log( "transferred property " + std::to_string( args.property_id ) + " (transfer "
               + std::to_string( *transfer_id ) + ")" );

  return program_errc::ok;
}

std::error_code deed_registry::verify( system_interface* system, const protocol::verify_arguments& args )
{
  auto key      = make_key( args.property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return program_errc::property_not_found;

  if( !valid_text( args.notes, max_notes_length, false ) )
    return program_errc::invalid_property_data;

  auto verification = get_record< protocol::verification_record >( system, space::verification, key )
                        .value_or( protocol::verification_record{} );

  if( verification.verified )
    return program_errc::already_verified;

  auto height = system->get_height();

  verification.verified  = true;
  verification.verifier  = get_caller( system );
  verification.timestamp = height;
  verification.notes     = args.notes;

  if( auto error = put_record( system, space::verification, key, verification ); error )
    return error;

  metadata->last_modified = height;

  if( auto error = put_record( system, space::metadata, key, *metadata ); error )
    return error;

  if( auto total = next_sequence( system, space::global_counter, make_key( global_sequence::verified ) ); !total )
    return total.error();

  system->log( "verified property " + std::to_string( args.property_id ) );

  return program_errc::ok;
}

result< std::uint64_t > deed_registry::add_document( system_interface* system,
                                                     const protocol::add_document_arguments& args )
{
  auto key      = make_key( args.property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return std::unexpected( program_errc::property_not_found );

  auto caller = get_caller( system );

  if( get_owner_record( system, args.property_id ) != caller )
    return std::unexpected( program_errc::unauthorized );

  if( !valid_text( args.title, max_document_title_length ) || !valid_text( args.type, max_document_type_length )
      || !valid_text( args.hash, max_document_hash_length )
      || !valid_text( args.description, max_document_description_length, false ) )
    return std::unexpected( program_errc::invalid_property_data );

  auto height = system->get_height();

  auto document_id =
    next_sequence( system, space::property_counter, make_key( args.property_id, property_sequence::documents ) );
  if( !document_id )
    return document_id;

  protocol::document_record record{ .title       = args.title,
                                    .type        = args.type,
                                    .hash        = args.hash,
                                    .timestamp   = height,
                                    .uploader    = caller,
                                    .description = args.description };

  if( auto error = put_record( system, space::document, make_key( args.property_id, *document_id ), record ); error )
    return std::unexpected( error );

  metadata->last_modified = height;

  if( auto error = put_record( system, space::metadata, key, *metadata ); error )
    return std::unexpected( error );

  system->log( "added document " + std::to_string( *document_id ) + " to property "
               + std::to_string( args.property_id ) );

  return document_id;
}

std::error_code deed_registry::change_status( system_interface* system,
                                              const protocol::change_status_arguments& args )
{
  auto key      = make_key( args.property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return program_errc::property_not_found;

  if( !valid_text( args.reason, max_reason_length, false ) )
    return program_errc::invalid_property_data;

  if( !transition_allowed( metadata->status, args.new_status ) )
    return program_errc::invalid_status;

  auto height = system->get_height();

  auto change_id = next_sequence( system,
                                  space::property_counter,
                                  make_key( args.property_id, property_sequence::status_changes ) );
  if( !change_id )
    return change_id.error();

  protocol::status_change_record record{ .old_status = metadata->status,
                                         .new_status = args.new_status,
                                         .timestamp  = height,
                                         .actor      = get_caller( system ),
                                         .reason     = args.reason };

  if( auto error = put_record( system, space::status_change, make_key( args.property_id, *change_id ), record );
      error )
    return error;

  metadata->status        = args.new_status;
  metadata->last_modified = height;

  if( auto error = put_record( system, space::metadata, key, *metadata ); error )
    return error;

  system->log( "changed status of property " + std::to_string( args.property_id ) + " to "
               + std::to_string( std::to_underlying( args.new_status ) ) );

  return program_errc::ok;
}

std::error_code deed_registry::grant_access( system_interface* system, const protocol::grant_arguments& args )
{
  if( !get_record< protocol::property_metadata >( system, space::metadata, make_key( args.property_id ) ) )
    return program_errc::property_not_found;

  auto caller = get_caller( system );

  if( get_owner_record( system, args.property_id ) != caller )
    return program_errc::unauthorized;

  if( !to_access_level( args.level ) )
    return program_errc::invalid_access_level;

  protocol::access_grant grant{ .level     = args.level,
                                .granter   = caller,
                                .timestamp = system->get_height(),
                                .expiry    = args.expiry,
                                .active    = true };

  if( auto error = put_record( system, space::access_grant, make_key( args.property_id, args.accessor ), grant );
      error )
    return error;

  system->log( "granted level " + std::to_string( args.level ) + " access to property "
               + std::to_string( args.property_id ) );

  return program_errc::ok;
}

std::error_code
deed_registry::revoke_access( system_interface* system, std::uint64_t property_id, const protocol::account& accessor )
{
  if( !get_record< protocol::property_metadata >( system, space::metadata, make_key( property_id ) ) )
    return program_errc::property_not_found;

  if( get_owner_record( system, property_id ) != get_caller( system ) )
    return program_errc::unauthorized;

  auto key   = make_key( property_id, accessor );
  auto grant = get_record< protocol::access_grant >( system, space::access_grant, key );
  if( !grant )
    return program_errc::grant_not_found;

  grant->active = false;

  if( auto error = put_record( system, space::access_grant, key, *grant ); error )
    return error;

  system->log( "revoked access to property " + std::to_string( property_id ) );

  return program_errc::ok;
}

result< protocol::property_info > deed_registry::get_property_info( system_interface* system,
                                                                    std::uint64_t property_id )
{
  auto key      = make_key( property_id );
  auto metadata = get_record< protocol::property_metadata >( system, space::metadata, key );
  if( !metadata )
    return std::unexpected( program_errc::property_not_found );

  protocol::property_info info;
  info.property_id  = property_id;
  info.owner        = get_owner_record( system, property_id ).value_or( protocol::account{} );
  info.metadata     = std::move( *metadata );
  info.verification = get_record< protocol::verification_record >( system, space::verification, key )
                        .value_or( protocol::verification_record{} );

  return info;
}

result< protocol::account > deed_registry::get_owner( system_interface* system, std::uint64_t property_id )
{
  if( auto owner = get_owner_record( system, property_id ); owner )
    return *owner;

  return std::unexpected( program_errc::property_not_found );
}

bool deed_registry::owns_property( system_interface* system,
                                   std::uint64_t property_id,
                                   const protocol::account& account )
{
  return get_owner_record( system, property_id ) == account;
}

bool deed_registry::get_owner_membership( system_interface* system,
                                          const protocol::account& owner,
                                          std::uint64_t property_id )
{
  auto object = system->get_object( space::membership, make_key( owner, property_id ) );
  if( object.size() != sizeof( bool ) )
    return false;

  return memory::bit_cast< bool >( object );
}

result< protocol::verification_record > deed_registry::get_verification( system_interface* system,
                                                                         std::uint64_t property_id )
{
  if( auto verification =
        get_record< protocol::verification_record >( system, space::verification, make_key( property_id ) );
      verification )
    return *verification;

  return std::unexpected( program_errc::property_not_found );
}

result< protocol::document_record >
deed_registry::get_document( system_interface* system, std::uint64_t property_id, std::uint64_t document_id )
{
  if( auto document =
        get_record< protocol::document_record >( system, space::document, make_key( property_id, document_id ) );
      document )
    return *document;

  return std::unexpected( program_errc::document_not_found );
}

result< protocol::transfer_record >
deed_registry::get_transfer( system_interface* system, std::uint64_t property_id, std::uint64_t transfer_id )
{
  if( auto record =
        get_record< protocol::transfer_record >( system, space::transfer, make_key( property_id, transfer_id ) );
      record )
    return *record;

  return std::unexpected( program_errc::transfer_not_found );
}

result< std::vector< protocol::status_change_record > >
deed_registry::get_status_history( system_interface* system, std::uint64_t property_id )
{
  if( !get_record< protocol::property_metadata >( system, space::metadata, make_key( property_id ) ) )
    return std::unexpected( program_errc::property_not_found );

  auto count = get_counter( system,
                            space::property_counter,
                            make_key( property_id, property_sequence::status_changes ) );

  std::vector< protocol::status_change_record > history;
  history.reserve( count );

  for( std::uint64_t change_id = 1; change_id <= count; ++change_id )
  {
    auto record = get_status_change( system, property_id, change_id );
    if( !record )
      return std::unexpected( record.error() );

    history.emplace_back( std::move( *record ) );
  }

  return history;
}

result< protocol::status_change_record >
deed_registry::get_status_change( system_interface* system, std::uint64_t property_id, std::uint64_t change_id )
{
  if( auto record = get_record< protocol::status_change_record >( system,
                                                                   space::status_change,
                                                                   make_key( property_id, change_id ) );
      record )
    return *record;

  return std::unexpected( program_errc::status_change_not_found );
}

bool deed_registry::check_access( system_interface* system,
                                  std::uint64_t property_id,
                                  const protocol::account& accessor,
                                  std::uint8_t required_level )
{
  auto owner = get_owner_record( system, property_id );
  if( !owner )
    return false;

  if( *owner == accessor )
    return true;

  auto grant = get_record< protocol::access_grant >( system, space::access_grant, make_key( property_id, accessor ) );
  if( !grant || !grant->active )
    return false;

  if( grant->expiry && system->get_height() > *grant->expiry )
    return false;

  return grant->level >= required_level;
}

result< protocol::access_grant >
deed_registry::get_access_grant( system_interface* system, std::uint64_t property_id, const protocol::account& accessor )
{
  if( !get_record< protocol::property_metadata >( system, space::metadata, make_key( property_id ) ) )
    return std::unexpected( program_errc::property_not_found );

  if( auto grant =
        get_record< protocol::access_grant >( system, space::access_grant, make_key( property_id, accessor ) );
      grant )
    return *grant;

  return std::unexpected( program_errc::grant_not_found );
}

std::uint64_t deed_registry::get_property_count( system_interface* system )
{
  return get_counter( system, space::global_counter, make_key( global_sequence::properties ) );
}

protocol::system_statistics deed_registry::get_system_statistics( system_interface* system )
{
  return protocol::system_statistics{
    .total_properties = get_counter( system, space::global_counter, make_key( global_sequence::properties ) ),
    .total_transfers  = get_counter( system, space::global_counter, make_key( global_sequence::transfers ) ),
    .total_verified   = get_counter( system, space::global_counter, make_key( global_sequence::verified ) ),
    .height           = system->get_height() };
}

result< protocol::property_counters > deed_registry::get_property_counters( system_interface* system,
                                                                            std::uint64_t property_id )
{
  if( !get_record< protocol::property_metadata >( system, space::metadata, make_key( property_id ) ) )
    return std::unexpected( program_errc::property_not_found );

  return protocol::property_counters{
    .transfers      = get_counter( system,
                              space::property_counter,
                              make_key( property_id, property_sequence::transfers ) ),
    .documents      = get_counter( system,
                              space::property_counter,
                              make_key( property_id, property_sequence::documents ) ),
    .status_changes = get_counter( system,
                                   space::property_counter,
                                   make_key( property_id, property_sequence::status_changes ) ) };
}

const protocol::account& deed_registry::id() const noexcept
{
  return protocol::deed_registry_id;
}

std::error_code deed_registry::run( system_interface* system, const std::span< const std::string > arguments )
{
  std::uint32_t instruction = 0;

  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( instruction ) ); error )
    return error;

  boost::endian::little_to_native_inplace( instruction );

  switch( instruction )
  {
    case std::to_underlying( instruction::register_property ):
      {
        auto args = read_arguments< protocol::register_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, register_property( system, *args ) );
      }
    case std::to_underlying( instruction::update_metadata ):
      {
        auto args = read_arguments< protocol::update_metadata_arguments >( system );
        if( !args )
          return args.error();

        return update_metadata( system, *args );
      }
    case std::to_underlying( instruction::transfer ):
      {
        auto args = read_arguments< protocol::transfer_arguments >( system );
        if( !args )
          return args.error();

        return transfer( system, *args );
      }
    case std::to_underlying( instruction::verify ):
      {
        auto args = read_arguments< protocol::verify_arguments >( system );
        if( !args )
          return args.error();

        return verify( system, *args );
      }
    case std::to_underlying( instruction::add_document ):
      {
        auto args = read_arguments< protocol::add_document_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, add_document( system, *args ) );
      }
    case std::to_underlying( instruction::change_status ):
      {
        auto args = read_arguments< protocol::change_status_arguments >( system );
        if( !args )
          return args.error();

        return change_status( system, *args );
      }
    case std::to_underlying( instruction::grant_access ):
      {
        auto args = read_arguments< protocol::grant_arguments >( system );
        if( !args )
          return args.error();

        return grant_access( system, *args );
      }
    case std::to_underlying( instruction::revoke_access ):
      {
        auto args = read_arguments< protocol::property_account_arguments >( system );
        if( !args )
          return args.error();

        return revoke_access( system, args->property_id, args->account_id );
      }
    case std::to_underlying( instruction::get_property_info ):
      {
        auto args = read_arguments< protocol::property_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_property_info( system, args->property_id ) );
      }
    case std::to_underlying( instruction::get_owner ):
      {
        auto args = read_arguments< protocol::property_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_owner( system, args->property_id ) );
      }
    case std::to_underlying( instruction::owns_property ):
      {
        auto args = read_arguments< protocol::property_account_arguments >( system );
        if( !args )
          return args.error();

        return write_value( system, owns_property( system, args->property_id, args->account_id ) );
      }
    case std::to_underlying( instruction::get_owner_membership ):
      {
        auto args = read_arguments< protocol::property_account_arguments >( system );
        if( !args )
          return args.error();

        return write_value( system, get_owner_membership( system, args->account_id, args->property_id ) );
      }
    case std::to_underlying( instruction::get_verification ):
      {
        auto args = read_arguments< protocol::property_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_verification( system, args->property_id ) );
      }
    case std::to_underlying( instruction::get_document ):
      {
        auto args = read_arguments< protocol::property_sequence_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_document( system, args->property_id, args->sequence ) );
      }
    case std::to_underlying( instruction::get_transfer ):
      {
        auto args = read_arguments< protocol::property_sequence_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_transfer( system, args->property_id, args->sequence ) );
      }
    case std::to_underlying( instruction::get_status_history ):
      {
        auto args = read_arguments< protocol::property_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_status_history( system, args->property_id ) );
      }
    case std::to_underlying( instruction::get_status_change ):
      {
        auto args = read_arguments< protocol::property_sequence_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_status_change( system, args->property_id, args->sequence ) );
      }
    case std::to_underlying( instruction::check_access ):
      {
        auto args = read_arguments< protocol::check_access_arguments >( system );
        if( !args )
          return args.error();

        return write_value( system,
                            check_access( system, args->property_id, args->accessor, args->required_level ) );
      }
    case std::to_underlying( instruction::get_access_grant ):
      {
        auto args = read_arguments< protocol::property_account_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_access_grant( system, args->property_id, args->account_id ) );
      }
    case std::to_underlying( instruction::get_property_count ):
      {
        return write_value( system, get_property_count( system ) );
      }
    case std::to_underlying( instruction::get_system_statistics ):
      {
        return write_value( system, get_system_statistics( system ) );
      }
    case std::to_underlying( instruction::get_property_counters ):
      {
        auto args = read_arguments< protocol::property_arguments >( system );
        if( !args )
          return args.error();

        return write_result( system, get_property_counters( system, args->property_id ) );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

} // namespace deedchain::program
