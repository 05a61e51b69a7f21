#include "ferry/core/result.hpp"

namespace ferry::core {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::DEVICE_UNAVAILABLE: return "DeviceUnavailable";
        case ErrorCode::TRANSPORT_ERROR: return "TransportError";
        case ErrorCode::INTEGRITY_ERROR: return "IntegrityError";
        case ErrorCode::INVALID_TRANSITION: return "InvalidTransition";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::STORAGE_ERROR: return "StorageError";
    }
    return "Unknown";
}

std::string Result::to_string() const {
    std::string text(error_code_name(error));
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

}
