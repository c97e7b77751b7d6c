#pragma once

#include "utils/logging.hpp"
#include "utils/math.hpp"
#include "utils/debug.hpp"
