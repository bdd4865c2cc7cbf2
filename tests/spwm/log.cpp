/// @file log.cpp
/// @brief Logging macros and println capture

#include "test.h"

using spwm_test::LogCapture;

TEST_CASE("SPWM_WARN prints through println with a file(line) prefix") {
    LogCapture capture;
    SPWM_WARN("pin " << 6 << " at " << 700 << " Hz");
    REQUIRE(capture.lines().size() == 1);
    const std::string &line = capture.lines()[0];
    CHECK(line.find("log.cpp(") != std::string::npos);
    CHECK(line.find("WARN: pin 6 at 700 Hz") != std::string::npos);
}

TEST_CASE("SPWM_ERROR prefixes ERROR") {
    LogCapture capture;
    SPWM_ERROR("write failed");
    REQUIRE(capture.lines().size() == 1);
    CHECK(capture.lines()[0] == "ERROR: write failed");
}

TEST_CASE("SPWM_DBG is active in test builds") {
    LogCapture capture;
    SPWM_DBG("value " << 0.5);
    CHECK(SOFTPWM_HAS_DBG == 1);
    CHECK(capture.contains("value 0.5"));
}

TEST_CASE("conditional variants only print when the condition holds") {
    LogCapture capture;
    SPWM_WARN_IF(false, "never");
    SPWM_ERROR_IF(false, "never");
    CHECK(capture.lines().empty());
    SPWM_WARN_IF(true, "once");
    CHECK(capture.lines().size() == 1);
}

TEST_CASE("disabled categories evaluate nothing") {
    LogCapture capture;
    int evaluated = 0;
    SPWM_DBG_NO_OP("count " << ++evaluated);
    CHECK(evaluated == 0);
    CHECK(capture.lines().empty());
}

TEST_CASE("usage errors are logged where they are returned") {
    std::unique_ptr<PulseEngine> engine = spwm_test::makeEngine(400, 100.0);
    LogCapture capture;
    CHECK(engine->setValue(1.5) == PwmError::InvalidParameter);
    CHECK(capture.contains("WARN:"));
    CHECK(capture.contains("1.5"));
}

TEST_CASE("getErrorString") {
    CHECK(std::string(getErrorString(PwmError::Ok)) == "Ok");
    CHECK(std::string(getErrorString(PwmError::InvalidParameter)) == "InvalidParameter");
    CHECK(std::string(getErrorString(PwmError::NullResource)) == "NullResource");
    CHECK(std::string(getErrorString(PwmError::AlreadyRunning)) == "AlreadyRunning");
    CHECK(std::string(getErrorString(PwmError::Disposed)) == "Disposed");
    CHECK(std::string(getErrorString(PwmError::ResourceUnavailable)) == "ResourceUnavailable");
    CHECK(std::string(getErrorString(PwmError::LoopContext)) == "LoopContext");
    CHECK(ok(PwmError::Ok));
    CHECK_FALSE(ok(PwmError::Disposed));
}

TEST_CASE("print handler is separate from println") {
    std::string printed;
    inject_print_handler([&printed](const char *str) { printed += str; });
    spwm::print("no ");
    spwm::print("newline");
    clear_io_handlers();
    CHECK(printed == "no newline");
}
