/// @file rgb_led.cpp
/// @brief Three channel LED wrapper

#include "test.h"

namespace {

void resetPins(const RgbLedConfig &config) {
    stub::resetPin(config.red.pin);
    stub::resetPin(config.green.pin);
    stub::resetPin(config.blue.pin);
}

RgbLedConfig testConfig() {
    return RgbLedConfig(ChannelConfig(500, 700.0),
                        ChannelConfig(501, 1000.0),
                        ChannelConfig(502, 1500.0));
}

} // namespace

TEST_CASE("RgbLedConfig defaults") {
    RgbLedConfig config;
    CHECK(config.red.pin == 6);
    CHECK(config.green.pin == 5);
    CHECK(config.blue.pin == 22);
    CHECK(config.red.frequency_hz == 700.0);
    CHECK(config.green.frequency_hz == 1000.0);
    CHECK(config.blue.frequency_hz == 1500.0);
    CHECK(config.red.value == 0.0);
}

TEST_CASE("RgbLed open, levels and dispose") {
    RgbLedConfig config = testConfig();
    resetPins(config);
    stub::StubPinController pins;
    std::unique_ptr<RgbLed> led;
    REQUIRE(RgbLed::open(pins, config, &led) == PwmError::Ok);

    CHECK(led->red().isRunning());
    CHECK(led->green().isRunning());
    CHECK(led->blue().isRunning());
    CHECK(led->channel(RgbLed::Green).pinNumber() == 501);

    SUBCASE("setLevels") {
        CHECK(led->setLevels(0.1, 0.2, 0.3) == PwmError::Ok);
        CHECK(led->red().value() == 0.1);
        CHECK(led->green().value() == 0.2);
        CHECK(led->blue().value() == 0.3);
    }

    SUBCASE("setLevels is all or nothing") {
        REQUIRE(led->setLevels(0.1, 0.2, 0.3) == PwmError::Ok);
        CHECK(led->setLevels(0.5, 0.5, 1.5) == PwmError::InvalidParameter);
        CHECK(led->red().value() == 0.1);
        CHECK(led->green().value() == 0.2);
        CHECK(led->blue().value() == 0.3);
    }

    SUBCASE("setColor maps 8-bit components") {
        CHECK(led->setColor(255, 0, 51) == PwmError::Ok);
        CHECK(led->red().value() == 1.0);
        CHECK(led->green().value() == 0.0);
        CHECK_CLOSE(led->blue().value(), 0.2, 1e-12);
    }

    SUBCASE("setFrequencies") {
        CHECK(led->setFrequencies(100.0, 200.0, 300.0) == PwmError::Ok);
        CHECK(led->blue().frequency() == 300.0);
        CHECK(led->setFrequencies(100.0, 0.0, 300.0) == PwmError::InvalidParameter);
        CHECK(led->red().frequency() == 100.0);
        CHECK(led->green().frequency() == 200.0);
    }

    SUBCASE("stop and start") {
        CHECK(led->stop() == PwmError::Ok);
        CHECK(led->red().runState() == RunState::Stopped);
        CHECK_FALSE(stub::getPinState(500));
        CHECK(led->start() == PwmError::Ok);
        CHECK(led->blue().isRunning());
        // Already running channels are skipped, not reported.
        CHECK(led->start() == PwmError::Ok);
    }

    CHECK(led->dispose() == PwmError::Ok);
    CHECK(led->red().isDisposed());
    CHECK(stub::getReleaseCount(500) == 1);
    CHECK(stub::getReleaseCount(501) == 1);
    CHECK(stub::getReleaseCount(502) == 1);
    CHECK(led->setLevels(0.5, 0.5, 0.5) == PwmError::Disposed);
    resetPins(config);
}

TEST_CASE("RgbLed open rolls back on a claimed pin") {
    RgbLedConfig config = testConfig();
    resetPins(config);
    stub::StubPinController pins;

    // Someone else holds blue.
    DigitalOutputPinPtr blue;
    REQUIRE(pins.openPin(502, &blue) == PwmError::Ok);

    std::unique_ptr<RgbLed> led;
    CHECK(RgbLed::open(pins, config, &led) == PwmError::ResourceUnavailable);
    CHECK(led == nullptr);
    CHECK_FALSE(stub::isClaimed(500));
    CHECK_FALSE(stub::isClaimed(501));
    CHECK(stub::getReleaseCount(500) == 1);
    CHECK(stub::getReleaseCount(501) == 1);
    blue->release();
    resetPins(config);
}

TEST_CASE("RgbLed open rejects an invalid config up front") {
    RgbLedConfig config = testConfig();
    config.green.value = -1.0;
    resetPins(config);
    stub::StubPinController pins;
    std::unique_ptr<RgbLed> led;
    CHECK(RgbLed::open(pins, config, &led) == PwmError::InvalidParameter);
    CHECK_FALSE(stub::isClaimed(500));
}
