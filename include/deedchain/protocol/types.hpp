#pragma once

#include <concepts>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/is_bitwise_serializable.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <deedchain/memory.hpp>

BOOST_IS_BITWISE_SERIALIZABLE( std::byte )

template< class T, class Archive >
concept Serializable = requires( T t, Archive a, const unsigned int v ) {
  { t.serialize( a, v ) } -> std::same_as< void >;
};

template< typename T >
concept Archivable = requires( boost::archive::binary_oarchive& oa, T a ) { oa << a; };

namespace deedchain::protocol {

constexpr unsigned int archive_flags = boost::archive::no_header | boost::archive::no_tracking;

/**
 * Serialize an optional value as a presence flag followed by the value.
 */
template< class Archive, typename T >
void serialize_optional( Archive& ar, std::optional< T >& opt )
{
  bool has_value = opt.has_value();
  ar & has_value;

  if( has_value )
  {
    if( !opt )
      opt.emplace();

    ar & *opt;
  }
  else
  {
    opt.reset();
  }
}

template< Archivable T >
std::vector< std::byte > to_binary( const T& t )
{
  std::stringstream stream;

  {
    boost::archive::binary_oarchive oa( stream, archive_flags );
    oa << t;
  }

  auto str   = stream.str();
  auto bytes = memory::as_bytes( str );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

/**
 * Deserialize an object from a binary archive.
 *
 * Throws boost::archive::archive_exception when the bytes do not hold a
 * complete archive of T.
 */
template< typename T >
T from_binary( std::span< const std::byte > bytes )
{
  std::stringstream stream( std::string( memory::as_string_view( bytes ) ) );
  boost::archive::binary_iarchive ia( stream, archive_flags );

  T t;
  ia >> t;
  return t;
}

} // namespace deedchain::protocol
