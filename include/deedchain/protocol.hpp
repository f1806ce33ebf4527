#pragma once

#include <deedchain/protocol/account.hpp>
#include <deedchain/protocol/arguments.hpp>
#include <deedchain/protocol/block.hpp>
#include <deedchain/protocol/deed.hpp>
#include <deedchain/protocol/program.hpp>
#include <deedchain/protocol/transaction.hpp>
#include <deedchain/protocol/types.hpp>
