#pragma once

#include <deedchain/program/deed_registry.hpp>
#include <deedchain/program/error.hpp>
#include <deedchain/program/program.hpp>
#include <deedchain/program/system_interface.hpp>
