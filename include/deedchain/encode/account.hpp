#pragma once

#include <string>
#include <string_view>

#include <deedchain/encode/error.hpp>
#include <deedchain/protocol/account.hpp>

namespace deedchain::encode {

/**
 * Accounts are written as 0x-prefixed hex of exactly 32 bytes, or as a name of
 * at most 32 printable characters which is zero padded to 32 bytes.
 */
result< protocol::account > from_account_string( std::string_view sv ) noexcept;

/**
 * Render an account as its name when it holds one, and as hex otherwise.
 */
std::string to_account_string( const protocol::account& a ) noexcept;

} // namespace deedchain::encode
