#include "spwm/time_format.h"

#include <cstdio>
#include <cstdlib>

namespace spwm {

std::string formatMicroseconds(nanoseconds width) {
    long long ns = width.count();
    const bool negative = ns < 0;
    // Tenths of a microsecond, rounded half away from zero.
    long long tenths = (std::llabs(ns) + 50) / 100;
    long long whole = tenths / 10;
    int decimal = static_cast<int>(tenths % 10);

    std::string digits = std::to_string(whole);
    std::string grouped;
    int count = 0;
    for (std::string::const_reverse_iterator it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    char tail[8];
    std::snprintf(tail, sizeof(tail), ".%d", decimal);

    std::string out = "(";
    if (negative && tenths != 0) {
        out += "-";
    }
    out += grouped;
    out += tail;
    out += " \xCE\xBCs)";
    return out;
}

} // namespace spwm
