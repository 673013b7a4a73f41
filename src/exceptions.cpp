#include "ledgerguard/exceptions.hpp"
#include <random>
#include <sstream>

namespace ledgerguard {

std::string LedgerGuardException::generateCorrelationId() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

LedgerGuardException::LedgerGuardException(ErrorCode code, std::string message,
                                           ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string LedgerGuardException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << errorCodeToString(errorCode_) << " "
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

void LedgerGuardException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : LedgerGuardException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << LedgerGuardException::toLogString();
    return ss.str();
}

} // namespace ledgerguard
