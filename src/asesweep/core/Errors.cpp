#include "asesweep/core/Errors.hpp"

namespace asesweep {

const char* toString(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::None:                return "none";
        case ErrorKind::Config:              return "config";
        case ErrorKind::DeviceUnavailable:   return "device_unavailable";
        case ErrorKind::DeviceCommunication: return "device_communication";
        case ErrorKind::DeviceTimeout:       return "device_timeout";
        case ErrorKind::SaturationExhausted: return "saturation_exhausted";
        case ErrorKind::PreconditionTimeout: return "precondition_timeout";
        case ErrorKind::Cancelled:           return "cancelled";
        case ErrorKind::Storage:             return "storage";
        case ErrorKind::Internal:            return "internal";
        default:                             return "?";
    }
}

} // namespace asesweep
