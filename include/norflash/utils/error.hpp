#pragma once

#include "norflash/utils/types.hpp"

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

// C++20 compatibility - std::expected is C++23
#if __cplusplus >= 202302L
#include <expected>
#endif

namespace norflash {

enum class ErrorCode {
    SUCCESS = 0,

    // Configuration errors
    CONFIG_INVALID_FORMAT = 1000,
    CONFIG_MISSING_FIELD = 1001,
    CONFIG_INVALID_VALUE = 1002,
    CONFIG_FILE_NOT_FOUND = 1003,

    // Flash legality errors
    FLASH_INVALID_PARAMETERS = 2000,
    FLASH_NOT_ALIGNED = 2001,
    FLASH_OUT_OF_BOUNDS = 2002,
    FLASH_NOT_ERASED = 2003,

    // Backing store errors
    BACKING_STORE_OPEN_FAILED = 3000,
    BACKING_STORE_READ_FAILED = 3001,
    BACKING_STORE_WRITE_FAILED = 3002,
    BACKING_STORE_SIZE_MISMATCH = 3003,

    // Generic errors
    INVALID_PARAMETER = 8000,
    OPERATION_FAILED = 8001,
    ALREADY_INITIALIZED = 8002
};

enum class ErrorCategory {
    NONE,
    CONFIGURATION,
    FLASH,
    BACKING_STORE,
    GENERIC
};

class Error {
public:
    explicit Error(ErrorCode code,
                   std::source_location location = std::source_location::current())
        : code_(code), message_(), location_(location) {}

    Error(ErrorCode code,
          const std::string& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(message), location_(location) {}

    Error(ErrorCode code,
          std::string&& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(std::move(message)), location_(location) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::source_location& location() const noexcept { return location_; }

    // Flash address the error refers to, e.g. the first non-erased byte
    const std::optional<Address>& address() const noexcept { return address_; }
    Error& with_address(Address address) {
        address_ = address;
        return *this;
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

    bool operator==(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
    std::optional<Address> address_;
};

// C++20 compatible implementation of std::expected (must come before Result typedef)
#if __cplusplus < 202302L
template<typename T>
class unexpected {
private:
    T error_;

public:
    constexpr explicit unexpected(T&& error) : error_(std::move(error)) {}
    constexpr explicit unexpected(const T& error) : error_(error) {}

    constexpr const T& value() const& { return error_; }
    constexpr T& value() & { return error_; }
    constexpr T&& value() && { return std::move(error_); }
};

template<typename T>
unexpected(T) -> unexpected<T>;

template<typename T, typename E>
class expected {
private:
    std::variant<T, E> data_;

public:
    constexpr expected() = default;
    constexpr expected(const T& value) : data_(std::in_place_index<0>, value) {}
    constexpr expected(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    constexpr expected(const unexpected<E>& unexp) : data_(std::in_place_index<1>, unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : data_(std::in_place_index<1>, std::move(unexp).value()) {}

    constexpr bool has_value() const { return data_.index() == 0; }
    constexpr explicit operator bool() const { return has_value(); }

    constexpr const T& value() const& { return std::get<0>(data_); }
    constexpr T& value() & { return std::get<0>(data_); }
    constexpr T&& value() && { return std::get<0>(std::move(data_)); }

    constexpr const E& error() const& { return std::get<1>(data_); }
    constexpr E& error() & { return std::get<1>(data_); }
    constexpr E&& error() && { return std::get<1>(std::move(data_)); }

    constexpr const T& operator*() const& { return value(); }
    constexpr T& operator*() & { return value(); }
    constexpr T&& operator*() && { return std::move(value()); }

    constexpr const T* operator->() const { return &value(); }
    constexpr T* operator->() { return &value(); }
};

// Specialization for void
template<typename E>
class expected<void, E> {
private:
    std::optional<E> error_;

public:
    constexpr expected() = default;
    constexpr expected(const unexpected<E>& unexp) : error_(unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : error_(std::move(unexp).value()) {}

    constexpr bool has_value() const { return !error_.has_value(); }
    constexpr explicit operator bool() const { return has_value(); }

    void value() const {
        if (error_.has_value()) {
            throw std::runtime_error("Expected contains error");
        }
    }

    constexpr const E& error() const& { return error_.value(); }
    constexpr E& error() & { return error_.value(); }
    constexpr E&& error() && { return std::move(error_.value()); }
};
#else
using std::expected;
using std::unexpected;
#endif // __cplusplus < 202302L

template<typename T>
using Result = expected<T, Error>;

#define RETURN_IF_ERROR(expr) \
    do { \
        auto result_ = (expr); \
        if (!result_) { \
            return ::norflash::unexpected(std::move(result_).error()); \
        } \
    } while (0)

#define NORFLASH_CONCAT_INNER(a, b) a##b
#define NORFLASH_CONCAT(a, b) NORFLASH_CONCAT_INNER(a, b)

#define ASSIGN_OR_RETURN(var, expr) \
    ASSIGN_OR_RETURN_IMPL(NORFLASH_CONCAT(result_, __LINE__), var, expr)

#define ASSIGN_OR_RETURN_IMPL(tmp, var, expr) \
    auto tmp = (expr); \
    if (!tmp) { \
        return ::norflash::unexpected(std::move(tmp).error()); \
    } \
    var = std::move(tmp).value()

#define MAKE_ERROR(code, message) \
    ::norflash::Error(::norflash::ErrorCode::code, message)

// Helper function for making errors
inline Error make_error(ErrorCode code,
                        const std::string& message,
                        std::source_location location = std::source_location::current()) {
    return Error(code, message, location);
}

const char* error_code_to_string(ErrorCode code) noexcept;
ErrorCategory get_error_category(ErrorCode code) noexcept;

}  // namespace norflash
