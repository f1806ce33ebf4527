#include <deedchain/state_db/error.hpp>

#include <string>
#include <utility>

namespace deedchain::state_db {

struct _state_db_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _state_db_category::name() const noexcept
{
  return "state_db";
}

std::string _state_db_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< state_db_errc >( condition ) )
  {
    case state_db_errc::ok:
      return "ok"s;
    case state_db_errc::not_open:
      return "database is not open"s;
    case state_db_errc::unknown_parent:
      return "state node is not a child of head"s;
  }
  std::unreachable();
}

const std::error_category& state_db_category() noexcept
{
  static _state_db_category category;
  return category;
}

std::error_code make_error_code( state_db_errc e )
{
  return std::error_code( static_cast< int >( e ), state_db_category() );
}

} // namespace deedchain::state_db
