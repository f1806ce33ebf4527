#pragma once

#include <deedchain/memory/memory.hpp>
