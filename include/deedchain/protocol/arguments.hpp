#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>

#include <deedchain/protocol/account.hpp>
#include <deedchain/protocol/deed.hpp>
#include <deedchain/protocol/types.hpp>

namespace deedchain::protocol {

struct register_arguments
{
  std::string title;
  std::string description;
  std::string location;
  std::string category;
  std::uint64_t area = 0;
  std::string unit;
  account initial_owner{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & title;
    ar & description;
    ar & location;
    ar & category;
    ar & area;
    ar & unit;
    ar & initial_owner;
  }
};

struct update_metadata_arguments
{
  std::uint64_t property_id = 0;
  std::string title;
  std::string description;
  std::string location;
  std::string category;
  std::uint64_t area = 0;
  std::string unit;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & title;
    ar & description;
    ar & location;
    ar & category;
    ar & area;
    ar & unit;
  }
};

struct transfer_arguments
{
  std::uint64_t property_id = 0;
  account new_owner{};
  std::string reason;
  std::optional< std::uint64_t > amount;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & new_owner;
    ar & reason;
    serialize_optional( ar, amount );
  }
};

struct verify_arguments
{
  std::uint64_t property_id = 0;
  std::string notes;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & notes;
  }
};

struct add_document_arguments
{
  std::uint64_t property_id = 0;
  std::string title;
  std::string type;
  std::string hash;
  std::string description;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & title;
    ar & type;
    ar & hash;
    ar & description;
  }
};

struct change_status_arguments
{
  std::uint64_t property_id  = 0;
  property_status new_status = property_status::active;
  std::string reason;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & new_status;
    ar & reason;
  }
};

struct grant_arguments
{
  std::uint64_t property_id = 0;
  account accessor{};
  std::uint8_t level = 0;
  std::optional< std::uint64_t > expiry;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & accessor;
    ar & level;
    serialize_optional( ar, expiry );
  }
};

struct check_access_arguments
{
  std::uint64_t property_id = 0;
  account accessor{};
  std::uint8_t required_level = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & accessor;
    ar & required_level;
  }
};

/**
 * Arguments naming a single property.
 */
struct property_arguments
{
  std::uint64_t property_id = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
  }
};

/**
 * Arguments naming a property and an account related to it (owner, accessor).
 */
struct property_account_arguments
{
  std::uint64_t property_id = 0;
  account account_id{};

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & account_id;
  }
};

/**
 * Arguments naming an entry in one of a property's histories.
 */
struct property_sequence_arguments
{
  std::uint64_t property_id = 0;
  std::uint64_t sequence    = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & property_id;
    ar & sequence;
  }
};

} // namespace deedchain::protocol
