#include "spwm/duty_cycle.h"

#include <cmath>

namespace spwm {
namespace duty_cycle {

namespace {
const double kNanosPerSecond = 1e9;
}

bool isValidFrequency(double frequency_hz) {
    return frequency_hz >= kMinFrequencyHz && frequency_hz <= kMaxFrequencyHz;
}

bool isValidValue(double value) {
    return value >= 0.0 && value <= 1.0;
}

PulsePhases computePhases(double frequency_hz, double value) {
    double exact = kNanosPerSecond / frequency_hz;
    // Also catches NaN, which fails every comparison.
    if (!(exact <= kMaxPeriodNanos)) {
        exact = kMaxPeriodNanos;
    }
    long long period = std::llround(exact);
    if (period < 1) {
        period = 1;
    }
    long long high = std::llround(static_cast<double>(period) * value);
    if (high > period) {
        high = period;
    }
    if (high < 0) {
        high = 0;
    }
    return PulsePhases(nanoseconds(period), nanoseconds(high),
                       nanoseconds(period - high));
}

} // namespace duty_cycle
} // namespace spwm
