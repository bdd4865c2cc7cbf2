#pragma once

/// @file platforms/native_sleep.h
/// @brief Suspension primitive used by the toggle loop
///
/// Suspends the calling thread without spinning. On POSIX the wait is a
/// nanosleep(2) that resumes with the remaining time after a signal, so an
/// EINTR never shortens a phase.

#include <chrono>
#include <thread>

#if defined(_WIN32)
    #define SOFTPWM_NATIVE_SLEEP_STL 1
#else
    #include <time.h>
    #include <errno.h>
#endif

namespace spwm {
namespace platforms {
namespace detail {

template<typename Rep, typename Period>
inline void native_sleep(const std::chrono::duration<Rep, Period>& sleep_duration) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(sleep_duration).count();

    if (ns <= 0) {
        return;
    }

#ifdef SOFTPWM_NATIVE_SLEEP_STL
    std::this_thread::sleep_for(std::chrono::nanoseconds(ns));
#else
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
    ts.tv_nsec = static_cast<long>(ns % 1000000000LL);

    // Handle EINTR (interrupted by signal) by retrying
    while (::nanosleep(&ts, &ts) == -1 && errno == EINTR) {
        // Continue with remaining time in ts
    }
#endif
}

} // namespace detail
} // namespace platforms
} // namespace spwm
