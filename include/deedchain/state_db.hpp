#pragma once

#include <deedchain/state_db/database.hpp>
#include <deedchain/state_db/error.hpp>
#include <deedchain/state_db/state_delta.hpp>
#include <deedchain/state_db/state_node.hpp>
#include <deedchain/state_db/types.hpp>
