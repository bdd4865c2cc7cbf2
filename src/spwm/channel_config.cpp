#include "spwm/channel_config.h"

#include "spwm/log.h"

namespace spwm {

bool isValidConfig(const ChannelConfig& config) {
    return config.pin >= 0
        && duty_cycle::isValidFrequency(config.frequency_hz)
        && duty_cycle::isValidValue(config.value);
}

PwmError openChannel(PinController& controller, const ChannelConfig& config,
                     std::unique_ptr<PulseEngine>* out) {
    if (!out) {
        SPWM_WARN("openChannel: null out parameter");
        return PwmError::NullResource;
    }
    if (!isValidConfig(config)) {
        SPWM_WARN("openChannel: invalid config for pin " << config.pin
                  << " (" << config.frequency_hz << " Hz, value " << config.value << ")");
        return PwmError::InvalidParameter;
    }

    DigitalOutputPinPtr pin;
    PwmError err = controller.openPin(config.pin, &pin);
    if (err != PwmError::Ok) {
        return err;
    }

    std::unique_ptr<PulseEngine> engine;
    err = PulseEngine::create(std::move(pin), config.frequency_hz, &engine);
    if (err != PwmError::Ok) {
        return err;
    }

    err = engine->setValue(config.value);
    if (err == PwmError::Ok && config.start) {
        err = engine->start();
    }
    if (err != PwmError::Ok) {
        SPWM_WARN("openChannel: pin " << config.pin << " failed with "
                  << getErrorString(err) << ", releasing");
        PwmError disposeErr = engine->dispose();
        SPWM_ERROR_IF(disposeErr != PwmError::Ok,
                      "openChannel: dispose failed: " << getErrorString(disposeErr));
        return err;
    }

    SPWM_LOG_CHANNEL("openChannel: pin " << config.pin << " ready");
    *out = std::move(engine);
    return PwmError::Ok;
}

} // namespace spwm
