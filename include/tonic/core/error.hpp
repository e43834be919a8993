#pragma once

/// @file error.hpp
/// @brief Error handling types for tonic_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace tonic_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    DecodeError,
    Cancelled,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Configuration errors, reported synchronously to the caller
struct ConfigError {
    enum class Kind : std::uint8_t {
        MissingSource,   // Neither a locator nor bytes were supplied
        UnknownSprite,   // Sprite name not defined on the asset
        UnknownAlias,    // Alias not registered in the library
        InvalidOption,   // Option value out of range or malformed
    };

    Kind kind;
    std::string message;
    std::string name;  // Sprite name, alias or option key

    [[nodiscard]] static ConfigError missing_source() {
        return ConfigError{Kind::MissingSource, "Sound src or src_buffer must be set", {}};
    }

    [[nodiscard]] static ConfigError unknown_sprite(const std::string& sprite) {
        return ConfigError{Kind::UnknownSprite, "Sprite not defined: " + sprite, sprite};
    }

    [[nodiscard]] static ConfigError unknown_alias(const std::string& alias) {
        return ConfigError{Kind::UnknownAlias, "No sound registered for alias: " + alias, alias};
    }

    [[nodiscard]] static ConfigError invalid_option(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidOption, "Invalid option '" + key + "': " + reason, key};
    }
};

/// Load errors, delivered through load callbacks and rejected play handles
struct LoadError {
    enum class Kind : std::uint8_t {
        IOFailed,      // Byte acquisition failed
        DecodeFailed,  // Bytes could not be decoded
        Cancelled,     // Pending load or autoplay was cancelled
    };

    Kind kind;
    std::string message;
    std::string locator;

    [[nodiscard]] static LoadError io_failed(const std::string& loc, const std::string& reason) {
        return LoadError{Kind::IOFailed, "Failed to read '" + loc + "': " + reason, loc};
    }

    [[nodiscard]] static LoadError decode_failed(const std::string& reason) {
        return LoadError{Kind::DecodeFailed, "Unable to decode file: " + reason, {}};
    }

    [[nodiscard]] static LoadError cancelled(const std::string& reason) {
        return LoadError{Kind::Cancelled, "Cancelled: " + reason, {}};
    }
};

/// Misuse of an object in its current state
struct UsageError {
    enum class Kind : std::uint8_t {
        DuplicateSprite,  // Sprite name already defined
        Destroyed,        // Object already destroyed
        NotPlayable,      // Asset has no decoded buffer
        InvalidWindow,    // Start/end offsets do not form a window
        NodeInUse,        // Effect node already attached to another chain
    };

    Kind kind;
    std::string message;
    std::string subject;

    [[nodiscard]] static UsageError duplicate_sprite(const std::string& sprite) {
        return UsageError{Kind::DuplicateSprite, "Sprite already defined: " + sprite, sprite};
    }

    [[nodiscard]] static UsageError destroyed(const std::string& what) {
        return UsageError{Kind::Destroyed, what + " has been destroyed", what};
    }

    [[nodiscard]] static UsageError not_playable(const std::string& what) {
        return UsageError{Kind::NotPlayable, what + " is not playable yet", what};
    }

    [[nodiscard]] static UsageError invalid_window(double start, double end) {
        return UsageError{Kind::InvalidWindow,
            "Invalid playback window [" + std::to_string(start) + ", " + std::to_string(end) + ")", {}};
    }

    [[nodiscard]] static UsageError node_in_use(const std::string& node) {
        return UsageError{Kind::NodeInUse, "Effect node '" + node + "' is attached to another chain", node};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ConfigError,
        LoadError,
        UsageError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LoadError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(UsageError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::MissingSource: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::UnknownSprite: return ErrorCode::NotFound;
            case ConfigError::Kind::UnknownAlias: return ErrorCode::NotFound;
            case ConfigError::Kind::InvalidOption: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LoadError::Kind kind) {
        switch (kind) {
            case LoadError::Kind::IOFailed: return ErrorCode::IOError;
            case LoadError::Kind::DecodeFailed: return ErrorCode::DecodeError;
            case LoadError::Kind::Cancelled: return ErrorCode::Cancelled;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(UsageError::Kind kind) {
        switch (kind) {
            case UsageError::Kind::DuplicateSprite: return ErrorCode::AlreadyExists;
            case UsageError::Kind::Destroyed: return ErrorCode::InvalidState;
            case UsageError::Kind::NotPlayable: return ErrorCode::InvalidState;
            case UsageError::Kind::InvalidWindow: return ErrorCode::InvalidArgument;
            case UsageError::Kind::NodeInUse: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value-or-error return type
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    static std::string describe(const E& err) {
        if constexpr (std::is_same_v<E, Error>) {
            return err.message();
        } else {
            return "error";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a one-line message with kind, detail and attached context
std::string build_error_chain(const Error& error);

} // namespace tonic_core
