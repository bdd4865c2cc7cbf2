#pragma once

/// @file spwm/rgb_led.h
/// @brief Three PulseEngines driving one common cathode RGB LED
///
/// Each color has its own pin and its own PWM frequency. Staggered
/// frequencies (700/1000/1500 Hz by default) keep the three loops from
/// switching in lockstep.

#include <cstdint>
#include <memory>

#include "spwm/channel_config.h"
#include "spwm/error.h"
#include "spwm/pin.h"
#include "spwm/pulse_engine.h"

namespace spwm {

/// Default wiring, Raspberry Pi BCM numbering.
struct RgbLedConfig {
    ChannelConfig red;
    ChannelConfig green;
    ChannelConfig blue;

    RgbLedConfig()
        : red(6, 700.0)
        , green(5, 1000.0)
        , blue(22, 1500.0) {}

    RgbLedConfig(const ChannelConfig& r, const ChannelConfig& g, const ChannelConfig& b)
        : red(r), green(g), blue(b) {}
};

class RgbLed {
  public:
    enum Color {
        Red = 0,
        Green,
        Blue,
        ColorCount
    };

    /// Opens all three channels or none: a failure disposes the channels
    /// already opened.
    static PwmError open(PinController& controller, const RgbLedConfig& config,
                         std::unique_ptr<RgbLed>* out);

    ~RgbLed();

    RgbLed(const RgbLed&) = delete;
    RgbLed& operator=(const RgbLed&) = delete;

    /// Sets all three duty values. Nothing changes unless all are valid.
    PwmError setLevels(double red, double green, double blue);

    /// 8-bit color, each component mapped to component / 255.
    PwmError setColor(uint8_t red, uint8_t green, uint8_t blue);

    /// Sets all three frequencies. Nothing changes unless all are valid.
    PwmError setFrequencies(double red, double green, double blue);

    /// Starts every channel that is not already running.
    PwmError start();
    PwmError stop();
    PwmError dispose();

    PulseEngine& channel(Color color) { return *mChannels[color]; }
    const PulseEngine& channel(Color color) const { return *mChannels[color]; }

    PulseEngine& red() { return channel(Red); }
    PulseEngine& green() { return channel(Green); }
    PulseEngine& blue() { return channel(Blue); }

  private:
    RgbLed() {}

    std::unique_ptr<PulseEngine> mChannels[ColorCount];
};

} // namespace spwm
