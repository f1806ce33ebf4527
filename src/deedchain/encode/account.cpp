#include <deedchain/encode/account.hpp>
#include <deedchain/encode/hex.hpp>

#include <algorithm>
#include <bit>
#include <cctype>

namespace deedchain::encode {

static bool printable( char c ) noexcept
{
  return std::isgraph( static_cast< unsigned char >( c ) ) != 0;
}

result< protocol::account > from_account_string( std::string_view sv ) noexcept
{
  protocol::account a{};

  if( sv.starts_with( "0x" ) )
  {
    auto bytes = from_hex( sv );
    if( !bytes )
      return std::unexpected( bytes.error() );

    if( bytes->size() != a.size() )
      return std::unexpected( encode_errc::invalid_account_length );

    std::ranges::copy( *bytes, a.begin() );
    return a;
  }

  if( sv.empty() )
    return std::unexpected( encode_errc::empty_account_name );

  if( sv.size() > a.size() )
    return std::unexpected( encode_errc::invalid_account_length );

  if( !std::ranges::all_of( sv, printable ) )
    return std::unexpected( encode_errc::invalid_character );

  return protocol::system_account( sv );
}

std::string to_account_string( const protocol::account& a ) noexcept
{
  auto padding = std::ranges::find( a, std::byte{ 0x00 } );
  auto length  = static_cast< std::size_t >( std::distance( a.begin(), padding ) );

  std::string name;
  name.reserve( length );

  for( auto itr = a.begin(); itr != padding; ++itr )
    name.push_back( std::bit_cast< char >( *itr ) );

  if( name.empty() || !std::ranges::all_of( name, printable )
      || !std::all_of( padding, a.end(),
                       []( std::byte b )
                       {
                         return b == std::byte{ 0x00 };
                       } ) )
    return to_hex( a );

  return name;
}

} // namespace deedchain::encode
