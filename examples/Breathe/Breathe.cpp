/// @file    Breathe.cpp
/// @brief   Fade an RGB LED in and out with three software PWM channels
/// @example Breathe.cpp
///
/// Runs on the in-memory stub pins by default. Pass --sysfs on a Linux board
/// to drive BCM pins 6, 5 and 22 through /sys/class/gpio.

#include <chrono>
#include <cmath>
#include <cstring>
#include <memory>
#include <thread>

#include "SoftPwm.h"

// How long to breathe, in seconds.
#ifndef BREATHE_SECONDS
#define BREATHE_SECONDS 5
#endif

// One full breath every two seconds.
#define BREATHE_PERIOD_MS 2000

namespace {

const double kTwoPi = 6.283185307179586;

// 0..1 on a sine curve, offset per color so the LED drifts through hues.
double breath(long elapsed_ms, double offset) {
    double phase = kTwoPi * (elapsed_ms % BREATHE_PERIOD_MS) / BREATHE_PERIOD_MS;
    return 0.5 + 0.5 * std::sin(phase + offset);
}

} // namespace

int main(int argc, char** argv) {
    bool use_sysfs = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--sysfs") == 0) {
            use_sysfs = true;
        }
    }

    std::unique_ptr<spwm::PinController> pins;
#if defined(__linux__)
    if (use_sysfs) {
        pins.reset(new spwm::posix::SysfsPinController());
    }
#else
    if (use_sysfs) {
        SPWM_WARN("--sysfs is only available on Linux, using stub pins");
    }
#endif
    if (!pins) {
        pins.reset(new spwm::stub::StubPinController());
    }

    std::unique_ptr<spwm::RgbLed> led;
    spwm::PwmError err = spwm::RgbLed::open(*pins, spwm::RgbLedConfig(), &led);
    if (err != spwm::PwmError::Ok) {
        SPWM_ERROR("could not open the LED: " << spwm::getErrorString(err));
        return 1;
    }

    const spwm::RgbLed::Color colors[] = {spwm::RgbLed::Red, spwm::RgbLed::Green,
                                          spwm::RgbLed::Blue};
    for (spwm::RgbLed::Color color : colors) {
        const spwm::PulseEngine& ch = led->channel(color);
        SPWM_WARN("pin " << ch.pinNumber() << ": " << ch.frequency() << " Hz, period "
                  << spwm::formatMicroseconds(ch.period()));
    }

    auto begin = std::chrono::steady_clock::now();
    const long total_ms = BREATHE_SECONDS * 1000L;
    long elapsed_ms = 0;
    while (elapsed_ms < total_ms) {
        err = led->setLevels(breath(elapsed_ms, 0.0),
                             breath(elapsed_ms, kTwoPi / 3),
                             breath(elapsed_ms, 2 * kTwoPi / 3));
        if (err != spwm::PwmError::Ok) {
            SPWM_ERROR("setLevels failed: " << spwm::getErrorString(err));
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        elapsed_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - begin)
                                           .count());
    }

    for (spwm::RgbLed::Color color : colors) {
        const spwm::PulseEngine& ch = led->channel(color);
        SPWM_WARN("pin " << ch.pinNumber() << ": " << ch.pulseCount() << " pulses");
    }

    err = led->dispose();
    if (err != spwm::PwmError::Ok) {
        SPWM_ERROR("dispose failed: " << spwm::getErrorString(err));
        return 1;
    }
    return 0;
}
