#include "spwm/error.h"

namespace spwm {

const char* getErrorString(PwmError err) {
    switch (err) {
        case PwmError::Ok: return "Ok";
        case PwmError::InvalidParameter: return "InvalidParameter";
        case PwmError::NullResource: return "NullResource";
        case PwmError::AlreadyRunning: return "AlreadyRunning";
        case PwmError::Disposed: return "Disposed";
        case PwmError::ResourceUnavailable: return "ResourceUnavailable";
        case PwmError::LoopContext: return "LoopContext";
    }
    return "Unknown";
}

} // namespace spwm
