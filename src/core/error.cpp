#include "cbu/core/error.hpp"

namespace cbu {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConfigurationIncomplete: return "ConfigurationIncomplete";
        case ErrorKind::AuthConsentRequired: return "AuthConsentRequired";
        case ErrorKind::FileNotFound: return "FileNotFound";
        case ErrorKind::SessionInvalid: return "SessionInvalid";
        case ErrorKind::TransientNetworkOrServer: return "TransientNetworkOrServer";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorKind::Storage: return "Storage";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string Error::summary() const {
    return std::string(to_string(kind)) + ": " + message;
}

Error make_error(ErrorKind kind, std::string message, std::string detail) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.detail = std::move(detail);
    return error;
}

} // namespace cbu
