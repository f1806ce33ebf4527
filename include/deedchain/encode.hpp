#pragma once

#include <deedchain/encode/account.hpp>
#include <deedchain/encode/error.hpp>
#include <deedchain/encode/hex.hpp>
