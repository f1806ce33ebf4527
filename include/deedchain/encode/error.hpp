#pragma once

#include <expected>
#include <system_error>

namespace deedchain::encode {

enum class encode_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_character,
  invalid_length,
  invalid_account_length,
  empty_account_name
};

const std::error_category& encode_category() noexcept;

std::error_code make_error_code( encode_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace deedchain::encode

template<>
struct std::is_error_code_enum< deedchain::encode::encode_errc >: public std::true_type
{};
