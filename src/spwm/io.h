#pragma once

#include <functional>

namespace spwm {

// Low level output used by every logging macro. Both functions are safe to
// call from the toggle loop threads; lines from different threads never interleave.

// Print a string without newline
void print(const char* str);

// Print a string with newline
void println(const char* str);

#ifdef SOFTPWM_TESTING

// Testing function handler types
using print_handler_t = std::function<void(const char*)>;
using println_handler_t = std::function<void(const char*)>;

// Inject function handlers for testing
void inject_print_handler(const print_handler_t& handler);
void inject_println_handler(const println_handler_t& handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();

#endif // SOFTPWM_TESTING

} // namespace spwm
