/// @file platforms/stub/stub_pin.cpp
/// @brief Stub GPIO state tracking implementation

#include "platforms/stub/stub_pin.h"

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

#include "spwm/log.h"

namespace spwm {
namespace stub {

// ============================================================================
// Internal State
// ============================================================================

namespace {

struct PinRecord {
    bool high = false;
    PinMode mode = PinMode::Input;
    size_t highWrites = 0;
    size_t lowWrites = 0;
    size_t releases = 0;
    bool claimed = false;
    bool armed = false;
    std::vector<PinEdge> edges;
};

std::mutex& registryMutex() {
    static std::mutex* m = new std::mutex();
    return *m;
}

/// Per-pin state. Heap-allocated and never freed: loop threads of engines in
/// static storage may still write during static destruction.
std::map<int, PinRecord>& registry() {
    static std::map<int, PinRecord>* pins = new std::map<int, PinRecord>();
    return *pins;
}

uint64_t nowNs() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count());
}

void recordWrite(int pin, bool high) {
    const uint64_t ts = nowNs();
    std::lock_guard<std::mutex> lock(registryMutex());
    PinRecord& rec = registry()[pin];
    rec.high = high;
    if (high) {
        rec.highWrites++;
    } else {
        rec.lowWrites++;
    }
    if (rec.armed) {
        PinEdge edge;
        edge.high = high;
        edge.timestamp_ns = ts;
        rec.edges.push_back(edge);
    }
}

bool tryClaim(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    PinRecord& rec = registry()[pin];
    if (rec.claimed) {
        return false;
    }
    rec.claimed = true;
    return true;
}

void setClaimed(int pin, bool claimed) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[pin].claimed = claimed;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

bool getPinState(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return false;
    return it->second.high;
}

PinMode getPinMode(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return PinMode::Input;
    return it->second.mode;
}

size_t getHighWriteCount(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return 0;
    return it->second.highWrites;
}

size_t getLowWriteCount(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return 0;
    return it->second.lowWrites;
}

size_t getWriteCount(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return 0;
    return it->second.highWrites + it->second.lowWrites;
}

size_t getReleaseCount(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return 0;
    return it->second.releases;
}

bool isClaimed(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return false;
    return it->second.claimed;
}

void armPinEdges(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    PinRecord& rec = registry()[pin];
    rec.edges.clear();
    rec.armed = true;
}

void clearPinEdges(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it != registry().end()) {
        it->second.edges.clear();
        it->second.armed = false;
    }
}

size_t getEdgeCount(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return 0;
    return it->second.edges.size();
}

PinEdge getEdge(int pin, size_t index) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto it = registry().find(pin);
    if (it == registry().end()) return PinEdge();
    const std::vector<PinEdge>& edges = it->second.edges;
    if (index >= edges.size()) return PinEdge();
    return edges[index];
}

void resetPin(int pin) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry().erase(pin);
}

// ============================================================================
// StubOutputPin
// ============================================================================

StubOutputPin::StubOutputPin(int pin) : mPin(pin), mReleased(false) {
    setClaimed(mPin, true);
}

StubOutputPin::~StubOutputPin() {
    if (!mReleased) {
        // Dropped without release(): free the claim so the number can be reused.
        setClaimed(mPin, false);
    }
}

void StubOutputPin::setOutputMode() {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[mPin].mode = PinMode::Output;
}

void StubOutputPin::writeHigh() {
    recordWrite(mPin, true);
}

void StubOutputPin::writeLow() {
    recordWrite(mPin, false);
}

void StubOutputPin::release() {
    std::lock_guard<std::mutex> lock(registryMutex());
    PinRecord& rec = registry()[mPin];
    rec.releases++;
    rec.claimed = false;
    mReleased = true;
}

// ============================================================================
// StubPinController
// ============================================================================

PwmError StubPinController::openPin(int pin, DigitalOutputPinPtr* out) {
    if (pin < 0 || !out) {
        SPWM_WARN("openPin: invalid pin " << pin);
        return PwmError::InvalidParameter;
    }
    if (!tryClaim(pin)) {
        SPWM_WARN("openPin: pin " << pin << " is already claimed");
        return PwmError::ResourceUnavailable;
    }
    out->reset(new StubOutputPin(pin));
    return PwmError::Ok;
}

} // namespace stub
} // namespace spwm
