#include <deedchain/program/error.hpp>

#include <string>
#include <utility>

namespace deedchain::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _program_category::name() const noexcept
{
  return "program";
}

std::string _program_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< program_errc >( condition ) )
  {
    case program_errc::ok:
      return "ok"s;
    case program_errc::unauthorized:
      return "unauthorized"s;
    case program_errc::property_not_found:
      return "property not found"s;
    case program_errc::invalid_owner:
      return "invalid owner"s;
    case program_errc::transfer_not_found:
      return "transfer not found"s;
    case program_errc::invalid_property_data:
      return "invalid property data"s;
    case program_errc::already_verified:
      return "already verified"s;
    case program_errc::invalid_status:
      return "invalid status"s;
    case program_errc::invalid_access_level:
      return "invalid access level"s;
    case program_errc::document_not_found:
      return "document not found"s;
    case program_errc::grant_not_found:
      return "grant not found"s;
    case program_errc::status_change_not_found:
      return "status change not found"s;
    case program_errc::invalid_instruction:
      return "invalid instruction"s;
    case program_errc::read_only_context:
      return "read only context"s;
  }
  return "unknown program error"s;
}

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace deedchain::program
