#include "spwm/rgb_led.h"

#include "spwm/log.h"

namespace spwm {

namespace {

// Keeps the first failure.
void mergeError(PwmError* first, PwmError err) {
    if (*first == PwmError::Ok) {
        *first = err;
    }
}

} // namespace

PwmError RgbLed::open(PinController& controller, const RgbLedConfig& config,
                      std::unique_ptr<RgbLed>* out) {
    if (!out) {
        SPWM_WARN("RgbLed::open: null out parameter");
        return PwmError::NullResource;
    }
    const ChannelConfig* configs[ColorCount] = {&config.red, &config.green, &config.blue};
    for (int i = 0; i < ColorCount; ++i) {
        if (!isValidConfig(*configs[i])) {
            SPWM_WARN("RgbLed::open: invalid config for pin " << configs[i]->pin);
            return PwmError::InvalidParameter;
        }
    }

    std::unique_ptr<RgbLed> led(new RgbLed());
    for (int i = 0; i < ColorCount; ++i) {
        PwmError err = openChannel(controller, *configs[i], &led->mChannels[i]);
        if (err != PwmError::Ok) {
            SPWM_WARN("RgbLed::open: channel " << i << " failed: " << getErrorString(err));
            PwmError disposeErr = led->dispose();
            SPWM_ERROR_IF(disposeErr != PwmError::Ok,
                          "RgbLed::open: rollback failed: " << getErrorString(disposeErr));
            return err;
        }
    }
    *out = std::move(led);
    return PwmError::Ok;
}

RgbLed::~RgbLed() {
    PwmError err = dispose();
    SPWM_ERROR_IF(err != PwmError::Ok, "RgbLed: dispose failed: " << getErrorString(err));
}

PwmError RgbLed::setLevels(double red, double green, double blue) {
    const double levels[ColorCount] = {red, green, blue};
    for (int i = 0; i < ColorCount; ++i) {
        if (!duty_cycle::isValidValue(levels[i])) {
            SPWM_WARN("RgbLed: level " << levels[i] << " outside [0, 1]");
            return PwmError::InvalidParameter;
        }
    }
    PwmError result = PwmError::Ok;
    for (int i = 0; i < ColorCount; ++i) {
        mergeError(&result, mChannels[i]->setValue(levels[i]));
    }
    return result;
}

PwmError RgbLed::setColor(uint8_t red, uint8_t green, uint8_t blue) {
    return setLevels(red / 255.0, green / 255.0, blue / 255.0);
}

PwmError RgbLed::setFrequencies(double red, double green, double blue) {
    const double frequencies[ColorCount] = {red, green, blue};
    for (int i = 0; i < ColorCount; ++i) {
        if (!duty_cycle::isValidFrequency(frequencies[i])) {
            SPWM_WARN("RgbLed: invalid frequency " << frequencies[i]);
            return PwmError::InvalidParameter;
        }
    }
    PwmError result = PwmError::Ok;
    for (int i = 0; i < ColorCount; ++i) {
        mergeError(&result, mChannels[i]->setFrequency(frequencies[i]));
    }
    return result;
}

PwmError RgbLed::start() {
    PwmError result = PwmError::Ok;
    for (int i = 0; i < ColorCount; ++i) {
        if (mChannels[i]->isRunning()) {
            continue;
        }
        mergeError(&result, mChannels[i]->start());
    }
    return result;
}

PwmError RgbLed::stop() {
    PwmError result = PwmError::Ok;
    for (int i = 0; i < ColorCount; ++i) {
        mergeError(&result, mChannels[i]->stop());
    }
    return result;
}

PwmError RgbLed::dispose() {
    PwmError result = PwmError::Ok;
    for (int i = 0; i < ColorCount; ++i) {
        if (mChannels[i]) {
            mergeError(&result, mChannels[i]->dispose());
        }
    }
    return result;
}

} // namespace spwm
