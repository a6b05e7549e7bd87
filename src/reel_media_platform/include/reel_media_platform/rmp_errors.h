#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace rmp {

// RMP-owned error codes (no FFmpeg codes escape)
enum class ErrorCode {
    Ok,
    MissingResource,
    NotPlayable,
    NoTracks,
    BadDuration,
    Timeout,
    Cancelled,   // cooperative cancellation; never published to callers
    Unknown      // platform error passthrough, message carries native description
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:              return "Ok";
        case ErrorCode::MissingResource: return "MissingResource";
        case ErrorCode::NotPlayable:     return "NotPlayable";
        case ErrorCode::NoTracks:        return "NoTracks";
        case ErrorCode::BadDuration:     return "BadDuration";
        case ErrorCode::Timeout:         return "Timeout";
        case ErrorCode::Cancelled:       return "Cancelled";
        case ErrorCode::Unknown:         return "Unknown";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error missing_resource(const std::string& path) {
        return {ErrorCode::MissingResource, "Resource not found: " + path};
    }
    static Error not_playable(const std::string& detail) {
        return {ErrorCode::NotPlayable, detail};
    }
    static Error no_tracks(const std::string& detail) {
        return {ErrorCode::NoTracks, detail};
    }
    static Error bad_duration(const std::string& detail) {
        return {ErrorCode::BadDuration, detail};
    }
    static Error timeout(const std::string& detail) {
        return {ErrorCode::Timeout, detail};
    }
    static Error cancelled() {
        return {ErrorCode::Cancelled, "Cancelled"};
    }
    static Error unknown(const std::string& detail) {
        return {ErrorCode::Unknown, detail};
    }

    bool is_cancelled() const { return code == ErrorCode::Cancelled; }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    // Access value (asserts if error)
    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    // Access error (asserts if ok)
    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace rmp
