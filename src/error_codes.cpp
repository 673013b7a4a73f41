#include "ledgerguard/error_codes.hpp"

namespace ledgerguard {

const std::unordered_map<ErrorCode, ErrorCodeInfo>& getErrorCodeInfo() {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
        // Validation errors
        {ErrorCode::INVALID_INPUT, {
            "INVALID_INPUT",
            "Invalid or missing input",
            "Validation",
            400
        }},
        {ErrorCode::INPUT_TOO_LONG, {
            "INPUT_TOO_LONG",
            "Input exceeds maximum length",
            "Validation",
            400
        }},
        {ErrorCode::INVALID_FORMAT, {
            "INVALID_FORMAT",
            "Invalid format",
            "Validation",
            400
        }},
        {ErrorCode::INVALID_RANGE, {
            "INVALID_RANGE",
            "Value out of valid range",
            "Validation",
            400
        }},
        {ErrorCode::SQL_INJECTION_DETECTED, {
            "SQL_INJECTION_DETECTED",
            "Potential SQL injection detected",
            "Validation",
            400
        }},
        {ErrorCode::XSS_DETECTED, {
            "XSS_DETECTED",
            "Potential XSS attack detected",
            "Validation",
            400
        }},
        {ErrorCode::INVALID_CHARACTERS, {
            "INVALID_CHARACTERS",
            "Input contains invalid characters",
            "Validation",
            400
        }},

        // Request boundary errors
        {ErrorCode::PAYLOAD_TOO_LARGE, {
            "PAYLOAD_TOO_LARGE",
            "Request body exceeds the configured limit",
            "Boundary",
            413 // Payload Too Large
        }},
        {ErrorCode::RATE_LIMIT_EXCEEDED, {
            "RATE_LIMIT_EXCEEDED",
            "Request rate limit exceeded",
            "Boundary",
            429 // Too Many Requests
        }},
        {ErrorCode::UNAUTHORIZED, {
            "UNAUTHORIZED",
            "Missing or invalid credentials",
            "Boundary",
            401
        }},
        {ErrorCode::NOT_FOUND, {
            "NOT_FOUND",
            "No route matches the request path",
            "Boundary",
            404
        }},
        {ErrorCode::METHOD_NOT_ALLOWED, {
            "METHOD_NOT_ALLOWED",
            "Route does not accept this method",
            "Boundary",
            405
        }},

        // System errors
        {ErrorCode::CONFIGURATION_ERROR, {
            "CONFIGURATION_ERROR",
            "Configuration loading or parsing failed",
            "System",
            500
        }},
        {ErrorCode::NETWORK_ERROR, {
            "NETWORK_ERROR",
            "Network operation failed",
            "System",
            502
        }},
        {ErrorCode::SERVICE_STARTUP_FAILED, {
            "SERVICE_STARTUP_FAILED",
            "Service initialization failed",
            "System",
            500
        }},
        {ErrorCode::INTERNAL_ERROR, {
            "INTERNAL_ERROR",
            "Unexpected internal error",
            "System",
            500
        }}
    };

    return errorInfo;
}

const char* errorCodeToString(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.name.c_str() : "UNKNOWN";
}

const char* getErrorCodeDescription(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.description.c_str() : "Unknown error";
}

int getDefaultHttpStatus(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.defaultHttpStatus : 500;
}

bool isValidationError(ErrorCode code) {
    auto value = static_cast<int>(code);
    return value >= 1000 && value < 2000;
}

} // namespace ledgerguard
