#pragma once

/// @file platforms/posix/sysfs_pin.h
/// @brief Linux sysfs GPIO backend (/sys/class/gpio)
///
/// Opening a pin exports it, switches its direction to "out" and keeps the
/// value file open so each write is a single pwrite(2). Release closes the
/// file and unexports the line. The kernel refuses a second export of the
/// same line, which gives exclusive ownership across processes as well.

#if defined(__linux__)

#include <string>

#include "spwm/pin.h"

namespace spwm {
namespace posix {

class SysfsOutputPin : public DigitalOutputPin {
  public:
    ~SysfsOutputPin() override;

    SysfsOutputPin(const SysfsOutputPin&) = delete;
    SysfsOutputPin& operator=(const SysfsOutputPin&) = delete;

    int pinNumber() const override { return mPin; }
    void setOutputMode() override;
    void writeHigh() override;
    void writeLow() override;
    void release() override;

  private:
    friend class SysfsPinController;
    SysfsOutputPin(const std::string& root, int pin, int valueFd);

    void writeValue(char level);

    std::string mRoot;
    int mPin;
    int mValueFd;
};

class SysfsPinController : public PinController {
  public:
    /// @param root sysfs gpio directory, overridable for chroots and tests
    explicit SysfsPinController(const std::string& root = "/sys/class/gpio");

    PwmError openPin(int pin, DigitalOutputPinPtr* out) override;

  private:
    std::string mRoot;
};

} // namespace posix
} // namespace spwm

#endif // __linux__
