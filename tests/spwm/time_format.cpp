/// @file time_format.cpp
/// @brief Microsecond display strings

#include "test.h"

TEST_CASE("formatMicroseconds") {
    CHECK(formatMicroseconds(nanoseconds(1428571)) == "(1,428.6 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(1000000)) == "(1,000.0 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(666667)) == "(666.7 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(500000)) == "(500.0 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(0)) == "(0.0 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(1234567890)) == "(1,234,567.9 \xCE\xBCs)");
}

TEST_CASE("formatMicroseconds - rounds to the nearest tenth") {
    CHECK(formatMicroseconds(nanoseconds(149)) == "(0.1 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(150)) == "(0.2 \xCE\xBCs)");
    CHECK(formatMicroseconds(nanoseconds(999950)) == "(1,000.0 \xCE\xBCs)");
}

TEST_CASE("formatMicroseconds - widths of the default LED channels") {
    CHECK(formatMicroseconds(duty_cycle::computePhases(700.0, 0.5).period) == "(1,428.6 \xCE\xBCs)");
    CHECK(formatMicroseconds(duty_cycle::computePhases(1500.0, 0.5).high) == "(333.3 \xCE\xBCs)");
}
