#include "norflash/utils/error.hpp"
#include <sstream>

namespace norflash {

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "]";

    if (!message_.empty()) {
        oss << " " << message_;
    }

    oss << " (at " << location_.file_name()
        << ":" << location_.line() << ")";

    return oss.str();
}

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "SUCCESS";

        // Configuration errors
        case ErrorCode::CONFIG_INVALID_FORMAT:
            return "CONFIG_INVALID_FORMAT";
        case ErrorCode::CONFIG_MISSING_FIELD:
            return "CONFIG_MISSING_FIELD";
        case ErrorCode::CONFIG_INVALID_VALUE:
            return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:
            return "CONFIG_FILE_NOT_FOUND";

        // Flash legality errors
        case ErrorCode::FLASH_INVALID_PARAMETERS:
            return "FLASH_INVALID_PARAMETERS";
        case ErrorCode::FLASH_NOT_ALIGNED:
            return "FLASH_NOT_ALIGNED";
        case ErrorCode::FLASH_OUT_OF_BOUNDS:
            return "FLASH_OUT_OF_BOUNDS";
        case ErrorCode::FLASH_NOT_ERASED:
            return "FLASH_NOT_ERASED";

        // Backing store errors
        case ErrorCode::BACKING_STORE_OPEN_FAILED:
            return "BACKING_STORE_OPEN_FAILED";
        case ErrorCode::BACKING_STORE_READ_FAILED:
            return "BACKING_STORE_READ_FAILED";
        case ErrorCode::BACKING_STORE_WRITE_FAILED:
            return "BACKING_STORE_WRITE_FAILED";
        case ErrorCode::BACKING_STORE_SIZE_MISMATCH:
            return "BACKING_STORE_SIZE_MISMATCH";

        // Generic errors
        case ErrorCode::INVALID_PARAMETER:
            return "INVALID_PARAMETER";
        case ErrorCode::OPERATION_FAILED:
            return "OPERATION_FAILED";
        case ErrorCode::ALREADY_INITIALIZED:
            return "ALREADY_INITIALIZED";

        default:
            return "UNKNOWN_ERROR";
    }
}

ErrorCategory get_error_category(ErrorCode code) noexcept {
    const int value = static_cast<int>(code);
    if (value == 0) {
        return ErrorCategory::NONE;
    }
    if (value >= 1000 && value < 2000) {
        return ErrorCategory::CONFIGURATION;
    }
    if (value >= 2000 && value < 3000) {
        return ErrorCategory::FLASH;
    }
    if (value >= 3000 && value < 4000) {
        return ErrorCategory::BACKING_STORE;
    }
    return ErrorCategory::GENERIC;
}

}  // namespace norflash
