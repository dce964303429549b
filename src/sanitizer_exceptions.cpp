#include "sanitizer_exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace logguard {

const char* getErrorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "Invalid input data or format";
        case ErrorCode::MISSING_FIELD: return "Required field is missing";
        case ErrorCode::INVALID_FORMAT: return "Value has an invalid format";
        case ErrorCode::INVALID_RANGE: return "Value is outside acceptable range";
        case ErrorCode::INVALID_TYPE: return "Value has an unexpected type";
        case ErrorCode::FILE_ERROR: return "File could not be read or written";
        case ErrorCode::RESOURCE_EXHAUSTED: return "Resource limit exhausted";
        case ErrorCode::CONFIGURATION_ERROR: return "Configuration is missing or invalid";
    }
    return "Unknown error";
}

std::string SanitizerException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

SanitizerException::SanitizerException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string SanitizerException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

std::string SanitizerException::toJsonString() const {
    nlohmann::json out = {
        {"correlationId", correlationId_},
        {"errorCode", static_cast<int>(errorCode_)},
        {"message", message_},
        {"timestamp", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp_.time_since_epoch()).count())}
    };

    if (!context_.empty()) {
        out["context"] = context_;
    }

    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void SanitizerException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void SanitizerException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : SanitizerException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << SanitizerException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : SanitizerException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << SanitizerException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason) {
    ErrorContext context;
    context["reason"] = reason;
    return ValidationException(ErrorCode::INVALID_INPUT,
                               "Validation failed: " + reason,
                               field, value, context);
}

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return SystemException(code, getErrorCodeDescription(code), component, context);
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isSystemError(const std::exception& ex) {
    return dynamic_cast<const SystemException*>(&ex) != nullptr;
}

} // namespace logguard
