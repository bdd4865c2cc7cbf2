#pragma once

/// @file spwm/config.h
/// Compile time configuration for SoftPwm. Every value can be overridden by
/// defining it before this header is included (or on the compiler command line).

// Pulse frequency a channel starts with when the caller does not supply one.
#ifndef SOFTPWM_DEFAULT_FREQUENCY_HZ
#define SOFTPWM_DEFAULT_FREQUENCY_HZ 100.0
#endif

// Duty value a channel starts with. 0.0 keeps the output low.
#ifndef SOFTPWM_DEFAULT_VALUE
#define SOFTPWM_DEFAULT_VALUE 0.0
#endif

// Set to 0 to compile the per-cycle pulsed event out of the toggle loop.
// Handling the event runs on the loop thread and adds jitter to the output.
#ifndef SOFTPWM_HAS_PULSE_EVENTS
#define SOFTPWM_HAS_PULSE_EVENTS 1
#endif

// Log categories, both off by default:
// #define SOFTPWM_LOG_CHANNEL_ENABLED   // lifecycle transitions and parameter changes
// #define SOFTPWM_LOG_LOOP_ENABLED      // every phase of every toggle loop (very noisy)

// Debug output is on for debug and test builds.
#if !defined(NDEBUG) || defined(SOFTPWM_TESTING)
#define SOFTPWM_FORCE_DBG 1
#endif
