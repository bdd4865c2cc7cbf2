#pragma once

#include <string>

#include "spwm/duty_cycle.h"

namespace spwm {

/// Renders a pulse width in microseconds the way the dimmer UI shows it:
/// thousands separators, one decimal, wrapped in parentheses.
/// 1428571 ns -> "(1,428.6 μs)"
std::string formatMicroseconds(nanoseconds width);

} // namespace spwm
