#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace docindex {

using FileId = int64_t;
using ChunkId = int64_t;

/// Failure categories carried by Error
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    CorruptedData,
    InvalidArgument,
    DatabaseError,
    TransactionFailed,
    InvalidState,
    InvalidData,
    InternalError,
    NotFound,
    NotSupported,
    WriteError,
    NotInitialized,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:           return "Success";
        case ErrorCode::FileNotFound:      return "File not found";
        case ErrorCode::PermissionDenied:  return "Permission denied";
        case ErrorCode::CorruptedData:     return "Corrupted data";
        case ErrorCode::InvalidArgument:   return "Invalid argument";
        case ErrorCode::DatabaseError:     return "Database error";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::InvalidState:      return "Invalid state";
        case ErrorCode::InvalidData:       return "Invalid data";
        case ErrorCode::InternalError:     return "Internal error";
        case ErrorCode::NotFound:          return "Not found";
        case ErrorCode::NotSupported:      return "Not supported";
        case ErrorCode::WriteError:        return "Write error";
        case ErrorCode::NotInitialized:    return "Not initialized";
        case ErrorCode::Unknown:           break;
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    friend bool operator==(const Error& error, ErrorCode c) { return error.code == c; }
};

namespace detail {

[[noreturn]] inline void throwBadResultAccess(const Error* error) {
    if (error)
        throw std::runtime_error("Result holds an error: " + error->message);
    throw std::runtime_error("Result holds a value, not an error");
}

} // namespace detail

/**
 * @brief Value or Error
 *
 * Accessing the wrong alternative throws std::runtime_error.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value())
            detail::throwBadResultAccess(std::get_if<Error>(&data_));
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value())
            detail::throwBadResultAccess(std::get_if<Error>(&data_));
        return std::get<T>(std::move(data_));
    }

    template <typename U> T value_or(U&& fallback) const& {
        return has_value() ? std::get<T>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

    const Error& error() const {
        if (has_value())
            detail::throwBadResultAccess(nullptr);
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : error_(error) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            detail::throwBadResultAccess(&error_);
    }

    const Error& error() const {
        if (has_value())
            detail::throwBadResultAccess(nullptr);
        return error_;
    }

private:
    Error error_;
};

} // namespace docindex

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<docindex::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(docindex::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", docindex::errorToString(error));
    }
};
#endif

namespace docindex {

inline constexpr size_t HASH_STRING_SIZE = 64; // Hex encoded SHA-256
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

} // namespace docindex
