#pragma once

/// @file platforms/stub/stub_pin.h
/// @brief In-memory GPIO for host builds and tests
///
/// Every stub pin writes into a process-wide registry keyed by pin number, so
/// tests can observe a pin after it has been handed to an engine. The registry
/// tracks the current level, the mode, write and release counters, whether
/// the pin is claimed, and an armable edge buffer with monotonic timestamps.
/// All functions are thread safe; the toggle loops write from their own threads.

#include <cstddef>
#include <cstdint>

#include "spwm/pin.h"

namespace spwm {
namespace stub {

/// One recorded write
struct PinEdge {
    bool high;              ///< level after this write
    uint64_t timestamp_ns;  ///< steady clock time of the write

    PinEdge() : high(false), timestamp_ns(0) {}
};

// ============================================================================
// Registry observation
// ============================================================================

/// Current level of a pin, false for pins never written.
bool getPinState(int pin);

/// Mode last set on a pin, Input for pins never configured.
PinMode getPinMode(int pin);

/// Number of writeHigh() calls since the last resetPin().
size_t getHighWriteCount(int pin);

/// Number of writeLow() calls since the last resetPin().
size_t getLowWriteCount(int pin);

/// Total writes since the last resetPin().
size_t getWriteCount(int pin);

/// Number of release() calls since the last resetPin().
size_t getReleaseCount(int pin);

/// True while a StubPinController (or a direct StubOutputPin) holds the pin.
bool isClaimed(int pin);

/// Start recording edges for a pin, discarding anything recorded before.
void armPinEdges(int pin);

/// Stop recording and discard recorded edges.
void clearPinEdges(int pin);

size_t getEdgeCount(int pin);

/// Edge by index; a default PinEdge when the index is out of range.
PinEdge getEdge(int pin, size_t index);

/// Forget everything about a pin (level, counters, claim, edges).
void resetPin(int pin);

// ============================================================================
// Pin implementation
// ============================================================================

/// DigitalOutputPin backed by the registry. Claims the pin on construction
/// and frees the claim on release().
class StubOutputPin : public DigitalOutputPin {
  public:
    explicit StubOutputPin(int pin);
    ~StubOutputPin() override;

    StubOutputPin(const StubOutputPin&) = delete;
    StubOutputPin& operator=(const StubOutputPin&) = delete;

    int pinNumber() const override { return mPin; }
    void setOutputMode() override;
    void writeHigh() override;
    void writeLow() override;
    void release() override;

  private:
    int mPin;
    bool mReleased;
};

/// PinController for the stub platform. A pin number can only be opened
/// again after the previous StubOutputPin for it was released.
class StubPinController : public PinController {
  public:
    PwmError openPin(int pin, DigitalOutputPinPtr* out) override;
};

} // namespace stub
} // namespace spwm
