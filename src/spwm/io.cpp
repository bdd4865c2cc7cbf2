#include "spwm/io.h"

#include <cstdio>
#include <mutex>

namespace spwm {

namespace {

std::mutex& ioMutex() {
    static std::mutex* m = new std::mutex();
    return *m;
}

#ifdef SOFTPWM_TESTING
print_handler_t& printHandler() {
    static print_handler_t* handler = new print_handler_t();
    return *handler;
}

println_handler_t& printlnHandler() {
    static println_handler_t* handler = new println_handler_t();
    return *handler;
}
#endif

} // namespace

void print(const char* str) {
    if (!str) {
        return;
    }
    std::lock_guard<std::mutex> lock(ioMutex());
#ifdef SOFTPWM_TESTING
    if (printHandler()) {
        printHandler()(str);
        return;
    }
#endif
    std::fputs(str, stdout);
    std::fflush(stdout);
}

void println(const char* str) {
    if (!str) {
        return;
    }
    std::lock_guard<std::mutex> lock(ioMutex());
#ifdef SOFTPWM_TESTING
    if (printlnHandler()) {
        printlnHandler()(str);
        return;
    }
#endif
    std::fputs(str, stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

#ifdef SOFTPWM_TESTING

void inject_print_handler(const print_handler_t& handler) {
    std::lock_guard<std::mutex> lock(ioMutex());
    printHandler() = handler;
}

void inject_println_handler(const println_handler_t& handler) {
    std::lock_guard<std::mutex> lock(ioMutex());
    printlnHandler() = handler;
}

void clear_io_handlers() {
    std::lock_guard<std::mutex> lock(ioMutex());
    printHandler() = print_handler_t();
    printlnHandler() = println_handler_t();
}

#endif // SOFTPWM_TESTING

} // namespace spwm
