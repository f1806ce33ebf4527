#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

namespace deedchain::protocol {

using account = std::array< std::byte, 32 >;

constexpr inline account system_account( std::string_view str )
{
  account a{};
  std::size_t length = std::min( str.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a[ i ] = static_cast< std::byte >( str[ i ] );
  return a;
}

constexpr account deed_registry_id = system_account( "deed_registry" );

} // namespace deedchain::protocol
