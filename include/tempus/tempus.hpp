#pragma once

/// Convenience umbrella header for the tempus library.

#include <tempus/core/calendar.hpp>
#include <tempus/core/decimal.hpp>
#include <tempus/core/epoch_seconds.hpp>
#include <tempus/core/error.hpp>
#include <tempus/core/leap_second.hpp>
#include <tempus/core/local.hpp>
#include <tempus/core/timestamp.hpp>
#include <tempus/core/zone_offset.hpp>
#include <tempus/text/rfc3339.hpp>
