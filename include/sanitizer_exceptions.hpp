#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace logguard {

// Error codes organized by category
enum class ErrorCode {
    // Validation errors (1000-1999)
    INVALID_INPUT = 1000,
    MISSING_FIELD = 1001,
    INVALID_FORMAT = 1002,
    INVALID_RANGE = 1003,
    INVALID_TYPE = 1004,

    // System errors (3000-3999)
    FILE_ERROR = 3002,
    RESOURCE_EXHAUSTED = 3005,
    CONFIGURATION_ERROR = 3006
};

using ErrorContext = std::unordered_map<std::string, std::string>;

const char* getErrorCodeDescription(ErrorCode code);

// Base exception with error context and correlation ID support
class SanitizerException : public std::exception {
public:
    SanitizerException(ErrorCode code, std::string message, ErrorContext context = {});

    SanitizerException(const SanitizerException& other) = default;
    SanitizerException& operator=(const SanitizerException& other) = default;
    SanitizerException(SanitizerException&& other) noexcept = default;
    SanitizerException& operator=(SanitizerException&& other) noexcept = default;

    virtual ~SanitizerException() = default;

    ErrorCode getCode() const { return errorCode_; }
    const std::string& getMessage() const { return message_; }
    const ErrorContext& getContext() const { return context_; }
    const std::string& getCorrelationId() const { return correlationId_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    const char* what() const noexcept override { return message_.c_str(); }

    virtual std::string toLogString() const;
    std::string toJsonString() const;

    void addContext(const std::string& key, const std::string& value);
    void setCorrelationId(const std::string& correlationId);

protected:
    ErrorCode errorCode_;
    std::string message_;
    ErrorContext context_;
    std::string correlationId_;
    std::chrono::system_clock::time_point timestamp_;

    static std::string generateCorrelationId();
};

// Invalid configuration values and malformed caller input (unknown enum
// names, bad self-test definitions)
class ValidationException : public SanitizerException {
public:
    ValidationException(ErrorCode code, std::string message,
                        std::string field = "", std::string value = "",
                        ErrorContext context = {});

    const std::string& getField() const { return field_; }
    const std::string& getValue() const { return value_; }

    std::string toLogString() const override;

private:
    std::string field_;
    std::string value_;
};

// Infrastructure failures such as unreadable configuration files
class SystemException : public SanitizerException {
public:
    SystemException(ErrorCode code, std::string message,
                    std::string component = "",
                    ErrorContext context = {});

    const std::string& getComponent() const { return component_; }

    std::string toLogString() const override;

private:
    std::string component_;
};

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason);

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details);

bool isValidationError(const std::exception& ex);
bool isSystemError(const std::exception& ex);

} // namespace logguard
