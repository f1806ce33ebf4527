#pragma once

#include <deedchain/controller/controller.hpp>
#include <deedchain/controller/error.hpp>
#include <deedchain/controller/state.hpp>
