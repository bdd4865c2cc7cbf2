#pragma once

#include <sstream>

#include "spwm/config.h"
#include "spwm/io.h"

namespace spwm {
// "build/src/spwm/pulse_engine.cpp" -> "src/spwm/pulse_engine.cpp"
// "blah/blah/blah.cpp" -> "blah.cpp"
inline const char *file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') {
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace spwm

// Swallows a stream expression without evaluating it, keeping the operands
// "used" so disabled log statements do not produce warnings.
#define SPWM_DBG_NO_OP(X)                                                      \
    do {                                                                       \
        if (false) {                                                           \
            std::ostringstream _spwm_unused;                                   \
            _spwm_unused << X;                                                 \
        }                                                                      \
    } while (0)

#ifdef SOFTPWM_FORCE_DBG
#define SOFTPWM_HAS_DBG 1
#define _SPWM_DBG(X)                                                           \
    do {                                                                       \
        std::ostringstream _spwm_os;                                           \
        _spwm_os << spwm::file_offset(__FILE__) << "(" << int(__LINE__)        \
                 << "): " << X;                                                \
        spwm::println(_spwm_os.str().c_str());                                 \
    } while (0)
#else
#define SOFTPWM_HAS_DBG 0
#define _SPWM_DBG(X) SPWM_DBG_NO_OP(X)
#endif

#define SPWM_DBG(X) _SPWM_DBG(X)

#ifndef SPWM_DBG_IF
#define SPWM_DBG_IF(COND, MSG)                                                 \
    if (COND)                                                                  \
    SPWM_DBG(MSG)
#endif // SPWM_DBG_IF
