#include "spwm/pulse_engine.h"

#include "platforms/native_sleep.h"
#include "spwm/log.h"

namespace spwm {

using platforms::detail::native_sleep;

PwmError PulseEngine::create(DigitalOutputPinPtr pin, double frequency_hz,
                             std::unique_ptr<PulseEngine>* out) {
    if (!pin) {
        SPWM_WARN("PulseEngine::create: no pin supplied");
        return PwmError::NullResource;
    }
    if (!out) {
        SPWM_WARN("PulseEngine::create: null out parameter");
        pin->release();
        return PwmError::NullResource;
    }
    if (!duty_cycle::isValidFrequency(frequency_hz)) {
        SPWM_WARN("PulseEngine::create: invalid frequency " << frequency_hz);
        pin->release();
        return PwmError::InvalidParameter;
    }
    out->reset(new PulseEngine(std::move(pin), frequency_hz));
    return PwmError::Ok;
}

PwmError PulseEngine::create(DigitalOutputPinPtr pin, std::unique_ptr<PulseEngine>* out) {
    return create(std::move(pin), SOFTPWM_DEFAULT_FREQUENCY_HZ, out);
}

// State the loop thread reads. The loop holds its own reference, so it stays
// valid when the engine is destroyed from a pulse handler.
struct PulseEngine::Shared {
    Shared(DigitalOutputPinPtr p, PulseEngine* o)
        : pinNumber(p->pinNumber())
        , pulseCount(0)
        , disposed(false)
        , abandoned(false)
        , pin(std::move(p))
        , owner(o) {}

    std::atomic<int> pinNumber;
    std::atomic<uint64_t> pulseCount;

    std::mutex paramsMutex;
    Params params;
    bool disposed;  // guarded by paramsMutex

    // Set when the engine is destroyed from the loop thread.
    std::atomic<bool> abandoned;

    DigitalOutputPinPtr pin;
    ChannelEvents events;
    PulseEngine* owner;

    Params snapshot() {
        std::lock_guard<std::mutex> lock(paramsMutex);
        return params;
    }
};

PulseEngine::PulseEngine(DigitalOutputPinPtr pin, double frequency_hz)
    : mShared(std::make_shared<Shared>(std::move(pin), this))
    , mLifecycle([this](RunState state) { onStateChanged(state); }) {
    mShared->params.frequency = frequency_hz;
    mShared->params.value = SOFTPWM_DEFAULT_VALUE;
    mShared->params.phases = duty_cycle::computePhases(frequency_hz, SOFTPWM_DEFAULT_VALUE);
    SPWM_LOG_CHANNEL("pin " << pinNumber() << ": created at " << frequency_hz << " Hz");
}

PulseEngine::~PulseEngine() {
    if (mLifecycle.isLoopThread()) {
        // Cannot join ourselves. The loop stops delivering, then releases the
        // pin after its current iteration.
        mShared->abandoned.store(true, std::memory_order_release);
        SPWM_WARN("pin " << pinNumber() << ": destroyed from its loop thread, "
                         "pin released when the loop exits");
        return;
    }
    PwmError err = dispose();
    SPWM_ERROR_IF(err != PwmError::Ok,
                  "pin " << pinNumber() << ": dispose in destructor failed: "
                         << getErrorString(err));
}

PulseEngine::Params PulseEngine::params() const {
    return mShared->snapshot();
}

int PulseEngine::pinNumber() const {
    return mShared->pinNumber.load(std::memory_order_acquire);
}

uint64_t PulseEngine::pulseCount() const {
    return mShared->pulseCount.load(std::memory_order_relaxed);
}

double PulseEngine::frequency() const { return params().frequency; }
double PulseEngine::value() const { return params().value; }
nanoseconds PulseEngine::period() const { return params().phases.period; }
nanoseconds PulseEngine::highWidth() const { return params().phases.high; }
nanoseconds PulseEngine::lowWidth() const { return params().phases.low; }
PulsePhases PulseEngine::phases() const { return params().phases; }

PwmError PulseEngine::setFrequency(double frequency_hz) {
    if (isDisposed()) {
        return PwmError::Disposed;
    }
    if (!duty_cycle::isValidFrequency(frequency_hz)) {
        SPWM_WARN("pin " << pinNumber() << ": invalid frequency " << frequency_hz);
        return PwmError::InvalidParameter;
    }

    std::lock_guard<std::recursive_mutex> change(mChangeMutex);
    {
        // Checked again under the lock that dispose() marks the channel with,
        // so a concurrent dispose either wins here or sees the new value.
        std::lock_guard<std::mutex> lock(mShared->paramsMutex);
        Params& p = mShared->params;
        if (mShared->disposed) {
            return PwmError::Disposed;
        }
        if (p.frequency == frequency_hz) {
            return PwmError::Ok;
        }
        p.frequency = frequency_hz;
        p.phases = duty_cycle::computePhases(frequency_hz, p.value);
    }
    SPWM_LOG_CHANNEL("pin " << pinNumber() << ": frequency " << frequency_hz << " Hz");

    fireChanged(ChannelProperty::Frequency);
    fireChanged(ChannelProperty::Period);
    fireChanged(ChannelProperty::HighWidth);
    fireChanged(ChannelProperty::LowWidth);
    return PwmError::Ok;
}

PwmError PulseEngine::setValue(double value) {
    if (isDisposed()) {
        return PwmError::Disposed;
    }
    if (!duty_cycle::isValidValue(value)) {
        SPWM_WARN("pin " << pinNumber() << ": value " << value << " outside [0, 1]");
        return PwmError::InvalidParameter;
    }

    std::lock_guard<std::recursive_mutex> change(mChangeMutex);
    {
        std::lock_guard<std::mutex> lock(mShared->paramsMutex);
        Params& p = mShared->params;
        if (mShared->disposed) {
            return PwmError::Disposed;
        }
        if (p.value == value) {
            return PwmError::Ok;
        }
        p.value = value;
        p.phases = duty_cycle::computePhases(p.frequency, value);
    }
    SPWM_LOG_CHANNEL("pin " << pinNumber() << ": value " << value);

    fireChanged(ChannelProperty::Value);
    fireChanged(ChannelProperty::HighWidth);
    fireChanged(ChannelProperty::LowWidth);
    return PwmError::Ok;
}

void PulseEngine::fireChanged(ChannelProperty property) {
    {
        std::lock_guard<std::mutex> lock(mShared->paramsMutex);
        if (mShared->disposed) {
            return;
        }
    }
    mShared->events.firePropertyChanged(this, property);
}

PwmError PulseEngine::start() {
    std::shared_ptr<Shared> shared = mShared;
    return mLifecycle.start(
        [shared](const std::atomic<bool>& cancelRequested) { runLoop(*shared, cancelRequested); },
        [shared]() {
            shared->pin->setOutputMode();
            shared->pin->writeLow();
        });
}

PwmError PulseEngine::stop() {
    return mLifecycle.stop();
}

PwmError PulseEngine::dispose() {
    Shared* shared = mShared.get();
    return mLifecycle.dispose([shared]() { releasePin(*shared); });
}

void PulseEngine::releasePin(Shared& shared) {
    {
        std::lock_guard<std::mutex> lock(shared.paramsMutex);
        shared.disposed = true;
    }
    if (!shared.pin) {
        return;
    }
    shared.pin->release();
    shared.pin.reset();
    shared.pinNumber.store(-1, std::memory_order_release);
}

void PulseEngine::runLoop(Shared& shared, const std::atomic<bool>& cancelRequested) {
    DigitalOutputPin* pin = shared.pin.get();
    SPWM_LOG_LOOP("pin " << pin->pinNumber() << ": loop enter");

    while (!cancelRequested.load(std::memory_order_acquire)) {
        Params p = shared.snapshot();
        if (p.value != 0.0) {
            pin->writeHigh();
        }
        SPWM_LOG_LOOP("pin " << pin->pinNumber() << ": high " << p.phases.high.count() << " ns");
        native_sleep(p.phases.high);

        if (cancelRequested.load(std::memory_order_acquire)) {
            break;
        }

        p = shared.snapshot();
        if (p.value != 1.0) {
            pin->writeLow();
        }
        SPWM_LOG_LOOP("pin " << pin->pinNumber() << ": low " << p.phases.low.count() << " ns");
        native_sleep(p.phases.low);

        shared.pulseCount.fetch_add(1, std::memory_order_relaxed);
#if SOFTPWM_HAS_PULSE_EVENTS
        shared.events.firePulsed(shared.owner, shared.abandoned);
#endif
    }

    // Idle level.
    pin->writeLow();
    SPWM_LOG_LOOP("pin " << pin->pinNumber() << ": loop exit");

    if (shared.abandoned.load(std::memory_order_acquire)) {
        // The engine is gone; nobody else will release the pin.
        releasePin(shared);
    }
}

void PulseEngine::onStateChanged(RunState state) {
    SPWM_LOG_CHANNEL("pin " << pinNumber() << ": " << runStateName(state));
    mShared->events.fireStateChanged(this, state);
}

void PulseEngine::addListener(ChannelListener *listener, int priority) {
    mShared->events.addListener(listener, priority);
}

void PulseEngine::removeListener(ChannelListener *listener) {
    mShared->events.removeListener(listener);
}

bool PulseEngine::hasListener(ChannelListener *listener) const {
    return mShared->events.hasListener(listener);
}

int PulseEngine::addPulseCallback(std::function<void()> callback) {
    return mShared->events.addPulseCallback(callback);
}

void PulseEngine::removePulseCallback(int id) {
    mShared->events.removePulseCallback(id);
}

} // namespace spwm
