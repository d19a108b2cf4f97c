#pragma once

#include "logging.hpp"
#include "timefmt.hpp"
#include "encoding.hpp"
