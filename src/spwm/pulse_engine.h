#pragma once

/// @file spwm/pulse_engine.h
/// @brief Software PWM on one digital output pin
///
/// A PulseEngine owns one DigitalOutputPin and, while running, one loop
/// thread that alternates the pin between a high phase and a low phase:
///
///   while not cancelled:
///       value != 0  -> drive high;  sleep highWidth
///       cancelled?  -> leave
///       value != 1  -> drive low;   sleep lowWidth
///       raise pulsed
///
/// Frequency and value can be changed at any time from any thread. Each phase
/// reads the parameters once, so a change is picked up at the next phase
/// boundary and never mid-phase. After the loop exits the pin is driven low.
///
/// Every operation reports failure through PwmError; nothing throws. A failed
/// setter leaves the channel unchanged.
///
/// Everything the loop touches lives in a block shared with the loop thread.
/// A pulse handler may therefore destroy the engine: the loop then finishes
/// the current cycle's dispatch without further deliveries, drives the pin
/// low, releases it and exits on its own.
///
/// Example:
///   spwm::stub::StubPinController pins;
///   spwm::DigitalOutputPinPtr pin;
///   pins.openPin(6, &pin);
///   std::unique_ptr<spwm::PulseEngine> led;
///   spwm::PulseEngine::create(std::move(pin), 700.0, &led);
///   led->setValue(0.5);
///   led->start();
///   ...
///   led->dispose();   // stops, drives low, releases the pin

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "spwm/channel_events.h"
#include "spwm/config.h"
#include "spwm/duty_cycle.h"
#include "spwm/error.h"
#include "spwm/lifecycle.h"
#include "spwm/pin.h"

namespace spwm {

class PulseEngine {
  public:
    /// Creates a stopped channel that owns `pin`.
    ///
    /// Ownership of the pin passes to this call in every case; when creation
    /// fails the pin is released before returning.
    /// @return NullResource for a null pin or null out, InvalidParameter for a
    ///         frequency that is not finite and above zero
    static PwmError create(DigitalOutputPinPtr pin, double frequency_hz,
                           std::unique_ptr<PulseEngine>* out);
    static PwmError create(DigitalOutputPinPtr pin, std::unique_ptr<PulseEngine>* out);

    /// Disposes the channel. From the loop thread, hands the pin over to the
    /// exiting loop instead.
    ~PulseEngine();

    PulseEngine(const PulseEngine&) = delete;
    PulseEngine& operator=(const PulseEngine&) = delete;

    /// Setting the current value again is a no-op and raises nothing.
    /// On change raises frequency, period, highWidth, lowWidth in that order.
    PwmError setFrequency(double frequency_hz);

    /// Fraction of each period the pin is high, in [0.0, 1.0].
    /// On change raises value, highWidth, lowWidth in that order.
    PwmError setValue(double value);

    /// Configures the pin as an output, drives it low and launches the loop.
    PwmError start();

    /// Cancels the loop and waits for it to exit. Returns within two periods
    /// plus scheduling latency. The pin is low afterwards.
    PwmError stop();

    /// stop(), then release the pin. Only the first call does anything.
    PwmError dispose();

    double frequency() const;
    double value() const;
    nanoseconds period() const;
    nanoseconds highWidth() const;
    nanoseconds lowWidth() const;
    PulsePhases phases() const;

    RunState runState() const { return mLifecycle.state(); }
    bool isRunning() const { return mLifecycle.isRunning(); }
    bool isDisposed() const { return mLifecycle.isDisposed(); }

    /// Pin number of the owned pin, -1 once disposed.
    int pinNumber() const;

    /// Completed cycles since construction. Not reset by stop().
    uint64_t pulseCount() const;

    void addListener(ChannelListener *listener, int priority = 0);
    void removeListener(ChannelListener *listener);
    bool hasListener(ChannelListener *listener) const;

    /// Callbacks run on the loop thread after every completed cycle.
    int addPulseCallback(std::function<void()> callback);
    void removePulseCallback(int id);

  private:
    struct Params {
        double frequency;
        double value;
        PulsePhases phases;
    };

    // Defined in pulse_engine.cpp.
    struct Shared;

    PulseEngine(DigitalOutputPinPtr pin, double frequency_hz);

    Params params() const;
    void fireChanged(ChannelProperty property);
    void onStateChanged(RunState state);

    static void runLoop(Shared& shared, const std::atomic<bool>& cancelRequested);
    static void releasePin(Shared& shared);

    std::shared_ptr<Shared> mShared;

    // Held across a parameter change and its notifications so listeners see
    // changes in the order they were applied.
    std::recursive_mutex mChangeMutex;

    // Declared last: destroyed first, so the loop is joined (or detached)
    // before the rest of the engine goes away.
    EngineLifecycleController mLifecycle;
};

} // namespace spwm
