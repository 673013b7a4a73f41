#include "ledgerguard/validation_error.hpp"
#include "ledgerguard/limits.hpp"
#include "ledgerguard/string_utils.hpp"
#include <sstream>

namespace ledgerguard {

ValidationError::ValidationError(std::string field, std::string value,
                                 std::string message, ErrorCode code)
    : field_(std::move(field)), value_(std::move(value)),
      message_(std::move(message)), code_(code) {}

std::string ValidationError::describe() const {
    if (field_.empty()) {
        return message_;
    }
    return field_ + ": " + message_;
}

std::string ValidationError::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] ErrorCode=" << errorCodeToString(code_)
       << " Field=\"" << field_ << "\""
       << " Message=\"" << message_ << "\"";
    if (!value_.empty()) {
        ss << " Value=\"" << string_utils::sanitize_for_log(value_) << "\"";
    }
    return ss.str();
}

bool ValidationError::operator==(const ValidationError& other) const {
    return field_ == other.field_ && value_ == other.value_ &&
           message_ == other.message_ && code_ == other.code_;
}

std::string ValidationError::truncateValue(std::string_view value) {
    if (value.size() <= limits::kDiagnosticValuePrefix) {
        return std::string(value);
    }
    return std::string(value.substr(0, limits::kDiagnosticValuePrefix)) + "...";
}

} // namespace ledgerguard
