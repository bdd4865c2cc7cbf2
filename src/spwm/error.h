#pragma once

#include "spwm/dbg.h"

#ifndef SPWM_ERROR
// SPWM_ERROR: Supports both string literals and stream-style formatting with << operator
#define SPWM_ERROR(X)                                                          \
    do {                                                                       \
        std::ostringstream _spwm_os;                                           \
        _spwm_os << "ERROR: " << X;                                            \
        spwm::println(_spwm_os.str().c_str());                                 \
    } while (0)
#define SPWM_ERROR_IF(COND, MSG) do { if (COND) SPWM_ERROR(MSG); } while (0)
#endif

namespace spwm {

/// Result of every fallible SoftPwm operation. Values are negative so they
/// can be passed through int based platform code unchanged.
enum class PwmError : int {
    Ok = 0,
    InvalidParameter = -1,     ///< frequency <= 0, value outside [0, 1], bad pin number
    NullResource = -2,         ///< no pin supplied
    AlreadyRunning = -3,       ///< start() on a running channel
    Disposed = -4,             ///< channel was disposed
    ResourceUnavailable = -5,  ///< pin already claimed or refused by the platform
    LoopContext = -6           ///< lifecycle call made from the channel's own loop thread
};

/// Stable name of an error kind, e.g. "InvalidParameter".
const char* getErrorString(PwmError err);

inline bool ok(PwmError err) { return err == PwmError::Ok; }

} // namespace spwm
