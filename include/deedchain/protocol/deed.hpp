#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <deedchain/protocol/account.hpp>
#include <deedchain/protocol/types.hpp>

namespace deedchain::protocol {

enum class property_status : std::uint8_t
{
  active    = 1,
  pending   = 2,
  suspended = 3,
  archived  = 4
};

struct property_metadata
{
  std::string title;
  std::string description;
  std::string location;
  std::string category;
  std::uint64_t area = 0;
  std::string unit;
  std::uint64_t registered_at = 0;
  std::uint64_t last_modified = 0;
  property_status status      = property_status::active;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & title;
    ar & description;
    ar & location;
    ar & category;
    ar & area;
    ar & unit;
    ar & registered_at;
    ar & last_modified;
    ar & status;
  }
};

struct transfer_record
{
  account from{};
  account to{};
  std::uint64_t timestamp = 0;
  std::string reason;
  std::optional< std::uint64_t > amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & to;
    ar & timestamp;
    ar & reason;
    serialize_optional( ar, amount );
  }
};

struct verification_record
{
  bool verified = false;
  account verifier{};
  std::uint64_t timestamp = 0;
  std::string notes;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & verified;
    ar & verifier;
    ar & timestamp;
    ar & notes;
  }
};

struct document_record
{
  std::string title;
  std::string type;
  std::string hash;
  std::uint64_t timestamp = 0;
  account uploader{};
  std::string description;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & title;
    ar & type;
    ar & hash;
    ar & timestamp;
    ar & uploader;
    ar & description;
  }
};

struct status_change_record
{
  property_status old_status = property_status::active;
  property_status new_status = property_status::active;
  std::uint64_t timestamp    = 0;
  account actor{};
  std::string reason;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & old_status;
    ar & new_status;
    ar & timestamp;
    ar & actor;
    ar & reason;
  }
};

/**
 * Access levels run from 1 to 4, a lower level is more privileged.
 */
struct access_grant
{
  std::uint8_t level = 0;
  account granter{};
  std::uint64_t timestamp = 0;
  std::optional< std::uint64_t > expiry;
  bool active = false;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & level;
    ar & granter;
    ar & timestamp;
    serialize_optional( ar, expiry );
    ar & active;
  }
};

struct property_info
{
  std::uint64_t property_id = 0;
  account owner{};
  property_metadata metadata;
  verification_record verification;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & owner;
    ar & metadata;
    ar & verification;
  }
};

struct property_counters
{
  std::uint64_t transfers      = 0;
  std::uint64_t documents      = 0;
  std::uint64_t status_changes = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & transfers;
    ar & documents;
    ar & status_changes;
  }
};

struct system_statistics
{
  std::uint64_t total_properties = 0;
  std::uint64_t total_transfers  = 0;
  std::uint64_t total_verified   = 0;
  std::uint64_t height           = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & total_properties;
    ar & total_transfers;
    ar & total_verified;
    ar & height;
  }
};

} // namespace deedchain::protocol
