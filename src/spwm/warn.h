#pragma once

#include "spwm/dbg.h"

// Warnings are printed in every build flavour, with the same file(line)
// prefix the debug output carries.
#ifndef SPWM_WARN
#define SPWM_WARN(X)                                                           \
    do {                                                                       \
        std::ostringstream _spwm_os;                                           \
        _spwm_os << spwm::file_offset(__FILE__) << "(" << int(__LINE__)        \
                 << "): WARN: " << X;                                          \
        spwm::println(_spwm_os.str().c_str());                                 \
    } while (0)
#define SPWM_WARN_IF(COND, MSG) do { if (COND) SPWM_WARN(MSG); } while (0)
#endif
