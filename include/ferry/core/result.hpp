#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace ferry::core {

// Error taxonomy shared by the scheduler, negotiator and storage layers
enum class ErrorCode {
    SUCCESS = 0,
    DEVICE_UNAVAILABLE,
    TRANSPORT_ERROR,
    INTEGRITY_ERROR,
    INVALID_TRANSITION,
    NOT_FOUND,
    INVALID_ARGUMENT,
    STORAGE_ERROR
};

std::string_view error_code_name(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;
    
    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == ErrorCode::SUCCESS; }
    explicit operator bool() const { return success(); }
    
    std::string to_string() const;
    
    static Result ok() { return Result(); }
};

}
