#include <gtest/gtest.h>

#include <deedchain/encode/hex.hpp>
#include <deedchain/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = deedchain::encode::to_hex( deedchain::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( deedchain::encode::to_hex( std::span< const std::byte >{} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = deedchain::encode::from_hex( valid_hex_str );

  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, deedchain::memory::as_bytes( data ) ) );

  decoded_data = deedchain::encode::from_hex( valid_hex_str.substr( 2 ) );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, deedchain::memory::as_bytes( data ) ) );

  decoded_data = deedchain::encode::from_hex( "0x0A0b"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_EQ( decoded_data->size(), 2 );
  EXPECT_EQ( decoded_data->at( 0 ), std::byte{ 0x0a } );
  EXPECT_EQ( decoded_data->at( 1 ), std::byte{ 0x0b } );

  decoded_data = deedchain::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = deedchain::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), deedchain::encode::encode_errc::invalid_length );
    EXPECT_EQ( decoded_data.error().message(),
               deedchain::encode::encode_category().message(
                 static_cast< int >( deedchain::encode::encode_errc::invalid_length ) ) );
  }

  decoded_data = deedchain::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error(), deedchain::encode::encode_errc::invalid_character );
    EXPECT_EQ( decoded_data.error().message(),
               deedchain::encode::encode_category().message(
                 static_cast< int >( deedchain::encode::encode_errc::invalid_character ) ) );
  }
}
