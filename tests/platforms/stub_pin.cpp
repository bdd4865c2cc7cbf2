/// @file stub_pin.cpp
/// @brief Stub GPIO registry and controller

#include "test.h"

TEST_CASE("stub pin - writes update the registry") {
    stub::resetPin(600);
    stub::StubOutputPin pin(600);
    CHECK(pin.pinNumber() == 600);
    CHECK(stub::isClaimed(600));
    CHECK(stub::getPinMode(600) == PinMode::Input);

    pin.setOutputMode();
    CHECK(stub::getPinMode(600) == PinMode::Output);

    pin.writeHigh();
    CHECK(stub::getPinState(600));
    pin.writeLow();
    pin.writeLow();
    CHECK_FALSE(stub::getPinState(600));
    CHECK(stub::getHighWriteCount(600) == 1);
    CHECK(stub::getLowWriteCount(600) == 2);
    CHECK(stub::getWriteCount(600) == 3);

    pin.release();
    CHECK(stub::getReleaseCount(600) == 1);
    CHECK_FALSE(stub::isClaimed(600));
}

TEST_CASE("stub pin - unknown pins read as defaults") {
    stub::resetPin(601);
    CHECK_FALSE(stub::getPinState(601));
    CHECK(stub::getWriteCount(601) == 0);
    CHECK(stub::getEdgeCount(601) == 0);
    CHECK_FALSE(stub::getEdge(601, 3).high);
    CHECK_FALSE(stub::isClaimed(601));
}

TEST_CASE("stub pin - edges are recorded only while armed") {
    stub::resetPin(602);
    stub::StubOutputPin pin(602);
    pin.writeHigh();
    CHECK(stub::getEdgeCount(602) == 0);

    stub::armPinEdges(602);
    pin.writeHigh();
    pin.writeLow();
    REQUIRE(stub::getEdgeCount(602) == 2);
    stub::PinEdge first = stub::getEdge(602, 0);
    stub::PinEdge second = stub::getEdge(602, 1);
    CHECK(first.high);
    CHECK_FALSE(second.high);
    CHECK(second.timestamp_ns >= first.timestamp_ns);

    stub::clearPinEdges(602);
    pin.writeHigh();
    CHECK(stub::getEdgeCount(602) == 0);
    pin.release();
}

TEST_CASE("StubPinController - exclusive ownership") {
    stub::resetPin(603);
    stub::StubPinController pins;
    DigitalOutputPinPtr a;
    DigitalOutputPinPtr b;

    REQUIRE(pins.openPin(603, &a) == PwmError::Ok);
    CHECK(pins.openPin(603, &b) == PwmError::ResourceUnavailable);
    CHECK(b == nullptr);

    a->release();
    CHECK(pins.openPin(603, &b) == PwmError::Ok);
    b.reset();  // dropped without release, claim is freed too
    CHECK_FALSE(stub::isClaimed(603));
}

TEST_CASE("StubPinController - invalid arguments") {
    stub::StubPinController pins;
    DigitalOutputPinPtr pin;
    CHECK(pins.openPin(-1, &pin) == PwmError::InvalidParameter);
    CHECK(pins.openPin(604, nullptr) == PwmError::InvalidParameter);
}
