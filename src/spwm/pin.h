#pragma once

/// @file spwm/pin.h
/// Platform independent digital output pin API
///
/// This header MUST remain minimal: no platform headers are included here.
/// Platform implementations live under platforms/ (stub for host builds and
/// tests, posix for Linux sysfs GPIO) and are only reached through the two
/// interfaces below.
///
/// A pin is owned exclusively by whoever holds its DigitalOutputPinPtr. The
/// engine that receives one keeps it for its whole lifetime and calls
/// release() exactly once.

#include <memory>

#include "spwm/error.h"

namespace spwm {

/// Pin mode configuration
enum class PinMode {
    Input = 0,         ///< Digital input (high impedance)
    Output             ///< Digital output (push-pull)
};

/// Digital pin value
enum class PinValue {
    Low = 0,           ///< Logic low (0V / GND)
    High = 1           ///< Logic high
};

/// One digital output line. Writes are synchronous: when writeHigh() or
/// writeLow() returns, the level has been applied.
class DigitalOutputPin {
  public:
    virtual ~DigitalOutputPin() {}

    /// Pin number in the platform's numbering, for diagnostics only.
    virtual int pinNumber() const = 0;

    /// Configure the line as a push-pull output.
    virtual void setOutputMode() = 0;

    virtual void writeHigh() = 0;
    virtual void writeLow() = 0;

    /// Give the line back to the platform. No call is valid afterwards.
    virtual void release() = 0;
};

typedef std::unique_ptr<DigitalOutputPin> DigitalOutputPinPtr;

/// Hands out pins exclusively. A pin stays claimed until the DigitalOutputPin
/// that was returned for it is released.
class PinController {
  public:
    virtual ~PinController() {}

    /// @param pin platform pin number
    /// @param out receives the pin on success, untouched on failure
    /// @return InvalidParameter for a negative number or null out,
    ///         ResourceUnavailable if the pin is claimed or cannot be opened
    virtual PwmError openPin(int pin, DigitalOutputPinPtr* out) = 0;
};

} // namespace spwm
