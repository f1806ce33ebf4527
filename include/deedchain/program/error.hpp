#pragma once

#include <expected>
#include <system_error>

namespace deedchain::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok                      = 0,
  unauthorized            = 1'001,
  property_not_found      = 1'002,
  invalid_owner           = 1'003,
  transfer_not_found      = 1'004,
  invalid_property_data   = 1'005,
  already_verified        = 1'006,
  invalid_status          = 1'007,
  invalid_access_level    = 1'008,
  document_not_found      = 1'009,
  grant_not_found         = 1'010,
  status_change_not_found = 1'011,
  invalid_instruction     = 1'012,
  read_only_context       = 1'013
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace deedchain::program

template<>
struct std::is_error_code_enum< deedchain::program::program_errc >: public std::true_type
{};
