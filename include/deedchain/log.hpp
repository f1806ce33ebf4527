#pragma once

#include <deedchain/log/log.hpp>
