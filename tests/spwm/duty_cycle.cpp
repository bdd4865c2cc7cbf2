/// @file duty_cycle.cpp
/// @brief Phase arithmetic and parameter validation

#include "test.h"

#include <cfloat>

TEST_CASE("computePhases - 700 Hz at half duty") {
    PulsePhases p = duty_cycle::computePhases(700.0, 0.5);

    // period is 1/700 s = 1428.571... us
    CHECK_CLOSE(duty_cycle::toSeconds(p.period) * 1e6, 1428.571, 0.001);
    CHECK_CLOSE(duty_cycle::toSeconds(p.high) * 1e6, 714.286, 0.002);
    CHECK_CLOSE(duty_cycle::toSeconds(p.low) * 1e6, 714.286, 0.002);
    CHECK(p.high + p.low == p.period);
}

TEST_CASE("computePhases - 1000 Hz at quarter duty") {
    PulsePhases p = duty_cycle::computePhases(1000.0, 0.25);
    CHECK(p.period == nanoseconds(1000000));
    CHECK(p.high == nanoseconds(250000));
    CHECK(p.low == nanoseconds(750000));
}

TEST_CASE("computePhases - widths always add up to the period") {
    const double frequencies[] = {0.5, 1.0, 3.0, 7.0, 100.0, 333.0, 700.0,
                                  1000.0, 1500.0, 2000.0, 44100.0, 1e6};
    const double values[] = {0.0, 0.001, 0.1, 1.0 / 3.0, 0.5, 0.6180339, 0.999, 1.0};
    for (double f : frequencies) {
        for (double v : values) {
            PulsePhases p = duty_cycle::computePhases(f, v);
            CHECK(p.high + p.low == p.period);
            CHECK(p.high.count() >= 0);
            CHECK(p.low.count() >= 0);
            // period rounds once, to the nearest nanosecond
            CHECK_CLOSE(static_cast<double>(p.period.count()), 1e9 / f, 0.5);
            // high/period tracks the value within one nanosecond of rounding
            CHECK_CLOSE(static_cast<double>(p.high.count()),
                        static_cast<double>(p.period.count()) * v, 0.5);
        }
    }
}

TEST_CASE("computePhases - duty extremes") {
    SUBCASE("value 0 is all low") {
        PulsePhases p = duty_cycle::computePhases(100.0, 0.0);
        CHECK(p.high == nanoseconds(0));
        CHECK(p.low == p.period);
    }
    SUBCASE("value 1 is all high") {
        PulsePhases p = duty_cycle::computePhases(100.0, 1.0);
        CHECK(p.high == p.period);
        CHECK(p.low == nanoseconds(0));
    }
    SUBCASE("highest frequency is a one nanosecond period") {
        PulsePhases p = duty_cycle::computePhases(duty_cycle::kMaxFrequencyHz, 0.5);
        CHECK(p.period == nanoseconds(1));
        CHECK(p.high + p.low == p.period);
    }
    SUBCASE("unvalidated input is clamped, never zero or negative") {
        PulsePhases fast = duty_cycle::computePhases(5e9, 0.5);
        CHECK(fast.period == nanoseconds(1));
        CHECK(fast.high + fast.low == fast.period);

        const nanoseconds longest(static_cast<long long>(duty_cycle::kMaxPeriodNanos));
        const double slow[] = {1e-12, DBL_MIN, std::nan("")};
        for (double f : slow) {
            PulsePhases p = duty_cycle::computePhases(f, 0.5);
            CHECK(p.period == longest);
            CHECK(p.high + p.low == p.period);
            CHECK(p.high.count() > 0);
        }
    }
}

TEST_CASE("isValidFrequency") {
    CHECK(duty_cycle::isValidFrequency(100.0));
    CHECK(duty_cycle::isValidFrequency(0.001));
    CHECK_FALSE(duty_cycle::isValidFrequency(0.0));
    CHECK_FALSE(duty_cycle::isValidFrequency(-5.0));
    CHECK_FALSE(duty_cycle::isValidFrequency(std::nan("")));
    CHECK_FALSE(duty_cycle::isValidFrequency(INFINITY));
}

TEST_CASE("isValidFrequency - range limits") {
    // Periods longer than the nanosecond range can hold.
    CHECK_FALSE(duty_cycle::isValidFrequency(1e-10));
    CHECK_FALSE(duty_cycle::isValidFrequency(1e-12));
    CHECK_FALSE(duty_cycle::isValidFrequency(DBL_MIN));
    // Periods shorter than half a nanosecond.
    CHECK_FALSE(duty_cycle::isValidFrequency(5e9));
    CHECK_FALSE(duty_cycle::isValidFrequency(DBL_MAX));

    CHECK(duty_cycle::isValidFrequency(duty_cycle::kMinFrequencyHz));
    CHECK(duty_cycle::isValidFrequency(1.1e-10));
    CHECK(duty_cycle::isValidFrequency(duty_cycle::kMaxFrequencyHz));
    CHECK(duty_cycle::isValidFrequency(2e9));
}

TEST_CASE("computePhases - lowest accepted frequency keeps its period") {
    PulsePhases p = duty_cycle::computePhases(1.1e-10, 0.5);
    // 1e9 / 1.1e-10 ns, about 288 years
    CHECK_CLOSE(static_cast<double>(p.period.count()) / (1e9 / 1.1e-10), 1.0, 1e-9);
    CHECK(p.period.count() <= static_cast<long long>(duty_cycle::kMaxPeriodNanos));
    CHECK(p.high + p.low == p.period);
    CHECK_CLOSE(static_cast<double>(p.high.count()) / static_cast<double>(p.period.count()),
                0.5, 1e-9);
}

TEST_CASE("isValidValue") {
    CHECK(duty_cycle::isValidValue(0.0));
    CHECK(duty_cycle::isValidValue(0.5));
    CHECK(duty_cycle::isValidValue(1.0));
    CHECK_FALSE(duty_cycle::isValidValue(-0.1));
    CHECK_FALSE(duty_cycle::isValidValue(1.5));
    CHECK_FALSE(duty_cycle::isValidValue(std::nan("")));
}
