#pragma once

#include <string_view>

namespace safeshred {

// Numeric values are part of the host ABI (see shred_c_api.h).
enum class ShredStatus {
    Ok = 0,
    InvalidArgument,
    AccessDenied,
    NotInitialized,
    IoError,
    UnlinkFailed,
    Cancelled
};

inline std::string_view ToString(const ShredStatus status) {
    switch (status) {
        case ShredStatus::Ok:
            return "Ok";
        case ShredStatus::InvalidArgument:
            return "InvalidArgument";
        case ShredStatus::AccessDenied:
            return "AccessDenied";
        case ShredStatus::NotInitialized:
            return "NotInitialized";
        case ShredStatus::IoError:
            return "IoError";
        case ShredStatus::UnlinkFailed:
            return "UnlinkFailed";
        case ShredStatus::Cancelled:
            return "Cancelled";
    }
    return "UnknownStatus";
}

}  // namespace safeshred
