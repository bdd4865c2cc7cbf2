#if defined(__linux__)

#include "platforms/posix/sysfs_pin.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "spwm/log.h"

namespace spwm {
namespace posix {

namespace {

// Writes a whole string to a sysfs attribute. Returns 0 or the errno value.
int writeAttribute(const std::string& path, const std::string& text) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return errno;
    }
    int err = 0;
    ssize_t n;
    do {
        n = ::write(fd, text.c_str(), text.size());
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        err = errno;
    } else if (static_cast<size_t>(n) != text.size()) {
        err = EIO;
    }
    ::close(fd);
    return err;
}

std::string pinDir(const std::string& root, int pin) {
    return root + "/gpio" + std::to_string(pin);
}

} // namespace

// ============================================================================
// SysfsOutputPin
// ============================================================================

SysfsOutputPin::SysfsOutputPin(const std::string& root, int pin, int valueFd)
    : mRoot(root), mPin(pin), mValueFd(valueFd) {}

SysfsOutputPin::~SysfsOutputPin() {
    if (mValueFd >= 0) {
        release();
    }
}

void SysfsOutputPin::setOutputMode() {
    if (mValueFd < 0) {
        SPWM_ERROR("gpio" << mPin << ": setOutputMode after release");
        return;
    }
    int err = writeAttribute(pinDir(mRoot, mPin) + "/direction", "out");
    SPWM_ERROR_IF(err != 0, "gpio" << mPin << ": direction write failed: " << std::strerror(err));
}

void SysfsOutputPin::writeHigh() {
    writeValue('1');
}

void SysfsOutputPin::writeLow() {
    writeValue('0');
}

void SysfsOutputPin::writeValue(char level) {
    if (mValueFd < 0) {
        SPWM_ERROR("gpio" << mPin << ": write after release");
        return;
    }
    ssize_t n;
    do {
        n = ::pwrite(mValueFd, &level, 1, 0);
    } while (n < 0 && errno == EINTR);
    SPWM_ERROR_IF(n != 1, "gpio" << mPin << ": value write failed: " << std::strerror(errno));
}

void SysfsOutputPin::release() {
    if (mValueFd < 0) {
        return;
    }
    ::close(mValueFd);
    mValueFd = -1;
    int err = writeAttribute(mRoot + "/unexport", std::to_string(mPin));
    SPWM_ERROR_IF(err != 0, "gpio" << mPin << ": unexport failed: " << std::strerror(err));
}

// ============================================================================
// SysfsPinController
// ============================================================================

SysfsPinController::SysfsPinController(const std::string& root) : mRoot(root) {}

PwmError SysfsPinController::openPin(int pin, DigitalOutputPinPtr* out) {
    if (pin < 0 || !out) {
        SPWM_WARN("openPin: invalid pin " << pin);
        return PwmError::InvalidParameter;
    }

    int err = writeAttribute(mRoot + "/export", std::to_string(pin));
    if (err != 0) {
        // EBUSY: already exported, by us or by another process.
        SPWM_WARN("openPin: export of gpio" << pin << " failed: " << std::strerror(err));
        return PwmError::ResourceUnavailable;
    }

    const std::string valuePath = pinDir(mRoot, pin) + "/value";
    int fd = ::open(valuePath.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        err = errno;
        SPWM_WARN("openPin: cannot open " << valuePath << ": " << std::strerror(err));
        int unexportErr = writeAttribute(mRoot + "/unexport", std::to_string(pin));
        SPWM_ERROR_IF(unexportErr != 0, "gpio" << pin << ": unexport failed: " << std::strerror(unexportErr));
        return PwmError::ResourceUnavailable;
    }

    out->reset(new SysfsOutputPin(mRoot, pin, fd));
    return PwmError::Ok;
}

} // namespace posix
} // namespace spwm

#endif // __linux__
