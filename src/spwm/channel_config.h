#pragma once

/// @file spwm/channel_config.h
/// Opening a configured channel in one call.

#include <memory>

#include "spwm/config.h"
#include "spwm/error.h"
#include "spwm/pin.h"
#include "spwm/pulse_engine.h"

namespace spwm {

struct ChannelConfig {
    int pin;
    double frequency_hz;
    double value;
    bool start;  ///< launch the loop before returning

    ChannelConfig()
        : pin(-1)
        , frequency_hz(SOFTPWM_DEFAULT_FREQUENCY_HZ)
        , value(SOFTPWM_DEFAULT_VALUE)
        , start(true) {}

    ChannelConfig(int pin, double frequency_hz, double value = SOFTPWM_DEFAULT_VALUE,
                  bool start = true)
        : pin(pin), frequency_hz(frequency_hz), value(value), start(start) {}
};

/// True when every field of `config` is in range.
bool isValidConfig(const ChannelConfig& config);

/// Opens `config.pin` on `controller`, creates a channel on it with the
/// configured frequency and value, and starts it when `config.start` is set.
///
/// The configuration is validated before the pin is opened. If a later step
/// fails the channel is disposed, so the pin is released again and `out` is
/// left untouched.
/// @return InvalidParameter, NullResource (null out), ResourceUnavailable,
///         or the error of the step that failed
PwmError openChannel(PinController& controller, const ChannelConfig& config,
                     std::unique_ptr<PulseEngine>* out);

} // namespace spwm
