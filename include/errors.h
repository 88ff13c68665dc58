#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace cabin_voice {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    IOError,
    ParseError,
    InvalidState,
    SchemaMismatch,     ///< Context update does not fit the context schema
    ValidationError,    ///< Command or payload failed local validation
    Timeout,            ///< External call exceeded its time budget
    ProviderError,      ///< External collaborator reported a failure
    IntegrityFailure,   ///< Startup security/integrity verification failed
    RecoveryFailed,     ///< Component stayed failed after its restart budget
    Unknown
};

/**
 * @brief How an error is routed by the orchestrator
 */
enum class ErrorClass {
    Transient,   ///< Retry/restart; never fatal on its own
    Validation,  ///< Reject locally, keep prior state, apologize for the turn
    Fatal        ///< Abort startup or shut down
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_schema_error(const std::string& message) {
    return Error(ErrorType::SchemaMismatch, message);
}

inline Error make_validation_error(const std::string& message) {
    return Error(ErrorType::ValidationError, message);
}

inline Error make_provider_error(const std::string& message) {
    return Error(ErrorType::ProviderError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

/// Map an error type onto the routing class used by the orchestrator
inline ErrorClass classify(ErrorType type) {
    switch (type) {
        case ErrorType::SchemaMismatch:
        case ErrorType::ValidationError:
        case ErrorType::ParseError:
            return ErrorClass::Validation;
        case ErrorType::IntegrityFailure:
        case ErrorType::RecoveryFailed:
            return ErrorClass::Fatal;
        default:
            return ErrorClass::Transient;
    }
}

/// Stable snake_case name, used in config (error_handling.critical_errors) and telemetry
inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:             return "none";
        case ErrorType::IOError:          return "io_error";
        case ErrorType::ParseError:       return "parse_error";
        case ErrorType::InvalidState:     return "invalid_state";
        case ErrorType::SchemaMismatch:   return "schema_mismatch";
        case ErrorType::ValidationError:  return "validation_error";
        case ErrorType::Timeout:          return "timeout";
        case ErrorType::ProviderError:    return "provider_error";
        case ErrorType::IntegrityFailure: return "integrity_failure";
        case ErrorType::RecoveryFailed:   return "recovery_failed";
        case ErrorType::Unknown:          return "unknown";
    }
    return "unknown";
}

inline std::optional<ErrorType> error_type_from_name(const std::string& name) {
    static const ErrorType all[] = {
        ErrorType::None, ErrorType::IOError, ErrorType::ParseError,
        ErrorType::InvalidState, ErrorType::SchemaMismatch, ErrorType::ValidationError,
        ErrorType::Timeout, ErrorType::ProviderError, ErrorType::IntegrityFailure,
        ErrorType::RecoveryFailed, ErrorType::Unknown
    };
    for (ErrorType t : all) {
        if (name == error_type_name(t)) return t;
    }
    return std::nullopt;
}

} // namespace cabin_voice
