#pragma once

#include <expected>
#include <system_error>

namespace deedchain::controller {

enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  failure,
  stack_overflow,
  bad_file_descriptor
};

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  not_open,
  malformed_block,
  unexpected_height
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace deedchain::controller

template<>
struct std::is_error_code_enum< deedchain::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< deedchain::controller::controller_errc >: public std::true_type
{};
