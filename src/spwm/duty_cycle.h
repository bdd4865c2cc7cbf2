#pragma once

/// @file spwm/duty_cycle.h
/// Phase arithmetic for software PWM.
///
/// All widths are integral nanoseconds. The period is rounded once from the
/// frequency, the high width is rounded from the period, and the low width is
/// whatever remains, so `high + low == period` holds exactly.

#include <chrono>

namespace spwm {

using nanoseconds = std::chrono::nanoseconds;

/// Durations of one PWM cycle
struct PulsePhases {
    nanoseconds period;  ///< 1 / frequency
    nanoseconds high;    ///< period * value
    nanoseconds low;     ///< period - high

    PulsePhases() : period(0), high(0), low(0) {}
    PulsePhases(nanoseconds p, nanoseconds h, nanoseconds l)
        : period(p), high(h), low(l) {}
};

namespace duty_cycle {

/// Longest period a channel can run, in nanoseconds (about 291 years).
/// Slightly below nanoseconds::max() so rounding cannot overflow.
const double kMaxPeriodNanos = 9.2e18;

/// Lowest accepted frequency, 1e9 / kMaxPeriodNanos.
const double kMinFrequencyHz = 1e9 / kMaxPeriodNanos;

/// Highest accepted frequency. The period still rounds to one nanosecond.
const double kMaxFrequencyHz = 2e9;

/// True for frequencies in [kMinFrequencyHz, kMaxFrequencyHz]. NaN and
/// infinities are rejected.
bool isValidFrequency(double frequency_hz);

/// True for values inside [0.0, 1.0]. NaN is rejected.
bool isValidValue(double value);

/// Computes period, high and low widths. Callers validate both inputs first;
/// an out of range period is clamped to [1 ns, kMaxPeriodNanos].
PulsePhases computePhases(double frequency_hz, double value);

/// Converts a width to seconds, for display and ratio checks.
inline double toSeconds(nanoseconds width) {
    return static_cast<double>(width.count()) / 1e9;
}

} // namespace duty_cycle
} // namespace spwm
