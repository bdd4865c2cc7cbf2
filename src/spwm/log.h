#pragma once

/// @file spwm/log.h
/// @brief Logging categories for the SoftPwm subsystems
///
/// Each category can be independently enabled via a preprocessor define;
/// disabled categories produce no code.
///
/// Usage:
///   #define SOFTPWM_LOG_CHANNEL_ENABLED
///   #include "spwm/log.h"
///
///   SPWM_LOG_CHANNEL("pin " << pin << " started at " << hz << " Hz");

#include "spwm/dbg.h"
#include "spwm/warn.h"
#include "spwm/error.h"

/// @brief Channel lifecycle and parameter logging
/// Logs start/stop/dispose transitions and frequency/value changes
#ifdef SOFTPWM_LOG_CHANNEL_ENABLED
    #define SPWM_LOG_CHANNEL(X) SPWM_WARN(X)
#else
    #define SPWM_LOG_CHANNEL(X) SPWM_DBG_NO_OP(X)
#endif

/// @brief Toggle loop logging
/// Logs every phase the loop enters. Printing from the loop thread perturbs
/// the output timing, so keep this off unless chasing a loop bug.
#ifdef SOFTPWM_LOG_LOOP_ENABLED
    #define SPWM_LOG_LOOP(X) SPWM_WARN(X)
#else
    #define SPWM_LOG_LOOP(X) SPWM_DBG_NO_OP(X)
#endif
