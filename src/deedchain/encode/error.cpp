#include <deedchain/encode/error.hpp>

#include <string>
#include <utility>

namespace deedchain::encode {

struct _encode_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _encode_category::name() const noexcept
{
  return "encode";
}

std::string _encode_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< encode_errc >( condition ) )
  {
    case encode_errc::ok:
      return "ok"s;
    case encode_errc::invalid_character:
      return "invalid character"s;
    case encode_errc::invalid_length:
      return "odd number of hex digits"s;
    case encode_errc::invalid_account_length:
      return "account does not fit in 32 bytes"s;
    case encode_errc::empty_account_name:
      return "account name is empty"s;
  }
  return "unknown encode error"s;
}

const std::error_category& encode_category() noexcept
{
  static _encode_category category;
  return category;
}

std::error_code make_error_code( encode_errc e )
{
  return std::error_code( static_cast< int >( e ), encode_category() );
}

} // namespace deedchain::encode
