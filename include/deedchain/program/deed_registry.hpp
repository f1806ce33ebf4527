#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <deedchain/program/error.hpp>
#include <deedchain/program/program.hpp>
#include <deedchain/protocol.hpp>

namespace deedchain::program {

enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
{
  register_property,
  update_metadata,
  transfer,
  verify,
  add_document,
  change_status,
  grant_access,
  revoke_access,
  get_property_info,
  get_owner,
  owns_property,
  get_owner_membership,
  get_verification,
  get_document,
  get_transfer,
  get_status_history,
  get_status_change,
  check_access,
  get_access_grant,
  get_property_count,
  get_system_statistics,
  get_property_counters
};

std::optional< instruction > to_instruction( std::string_view name ) noexcept;
std::string_view to_string( instruction i ) noexcept;

constexpr std::size_t max_title_length                = 100;
constexpr std::size_t max_description_length          = 500;
constexpr std::size_t max_location_length             = 200;
constexpr std::size_t max_category_length             = 50;
constexpr std::size_t max_unit_length                 = 20;
constexpr std::size_t max_reason_length               = 200;
constexpr std::size_t max_notes_length                = 300;
constexpr std::size_t max_document_hash_length        = 64;
constexpr std::size_t max_document_title_length       = 100;
constexpr std::size_t max_document_type_length        = 50;
constexpr std::size_t max_document_description_length = 500;

constexpr std::uint8_t min_access_level = 1;
constexpr std::uint8_t max_access_level = 4;

std::optional< std::uint8_t > to_access_level( std::uint64_t level ) noexcept;

bool transition_allowed( protocol::property_status from, protocol::property_status to ) noexcept;

/**
 * The deed registry keeps every property record in the object space of the
 * running program.
 *
 * Mutating operations check, in order, that the property exists, that the
 * caller may perform the operation, that the input is well formed and that the
 * business rule holds. No object is written before every check has passed.
 *
 * run() decodes a call from stdin: a little endian instruction, a little
 * endian payload length and a binary archive of the instruction's arguments.
 * The result, if any, is written to stdout as a binary archive.
 */
struct deed_registry final: public program
{
  deed_registry()                       = default;
  deed_registry( const deed_registry& ) = delete;
  deed_registry( deed_registry&& )      = delete;
  ~deed_registry() override             = default;

  deed_registry& operator=( const deed_registry& ) = delete;
  deed_registry& operator=( deed_registry&& )      = delete;

  const protocol::account& id() const noexcept override;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

  result< std::uint64_t > register_property( system_interface* system, const protocol::register_arguments& args );
  std::error_code update_metadata( system_interface* system, const protocol::update_metadata_arguments& args );
  std::error_code transfer( system_interface* system, const protocol::transfer_arguments& args );
  std::error_code verify( system_interface* system, const protocol::verify_arguments& args );
  result< std::uint64_t > add_document( system_interface* system, const protocol::add_document_arguments& args );
  std::error_code change_status( system_interface* system, const protocol::change_status_arguments& args );
  std::error_code grant_access( system_interface* system, const protocol::grant_arguments& args );
  std::error_code
  revoke_access( system_interface* system, std::uint64_t property_id, const protocol::account& accessor );

  result< protocol::property_info > get_property_info( system_interface* system, std::uint64_t property_id );
  result< protocol::account > get_owner( system_interface* system, std::uint64_t property_id );
  bool owns_property( system_interface* system, std::uint64_t property_id, const protocol::account& account );
  bool get_owner_membership( system_interface* system, const protocol::account& owner, std::uint64_t property_id );
  result< protocol::verification_record > get_verification( system_interface* system, std::uint64_t property_id );
  result< protocol::document_record >
  get_document( system_interface* system, std::uint64_t property_id, std::uint64_t document_id );
  result< protocol::transfer_record >
  get_transfer( system_interface* system, std::uint64_t property_id, std::uint64_t transfer_id );
  result< std::vector< protocol::status_change_record > > get_status_history( system_interface* system,
                                                                              std::uint64_t property_id );
  result< protocol::status_change_record >
  get_status_change( system_interface* system, std::uint64_t property_id, std::uint64_t change_id );
  bool check_access( system_interface* system,
                     std::uint64_t property_id,
                     const protocol::account& accessor,
                     std::uint8_t required_level );
  result< protocol::access_grant >
  get_access_grant( system_interface* system, std::uint64_t property_id, const protocol::account& accessor );
  std::uint64_t get_property_count( system_interface* system );
  protocol::system_statistics get_system_statistics( system_interface* system );
  result< protocol::property_counters > get_property_counters( system_interface* system,
                                                               std::uint64_t property_id );
};

} // namespace deedchain::program
