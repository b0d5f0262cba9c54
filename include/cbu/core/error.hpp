#pragma once

#include <string>

namespace cbu {

/**
 * @brief Failure classes of an upload attempt
 *
 * Each kind maps to one session effect and one retry policy:
 * - ConfigurationIncomplete: nothing persisted yet, user must fix config
 * - AuthConsentRequired: session untouched, surfaced as NeedsConsent
 * - FileNotFound: local source missing or unreadable
 * - SessionInvalid: stored session unusable, cleared and replaced by a fresh one
 * - TransientNetworkOrServer: session preserved, whole attempt retried later
 * - ProtocolViolation: session preserved, whole attempt retried later
 * - IntegrityMismatch: session preserved, whole attempt retried later
 * - Storage: local persistence failed
 * - Cancelled: caller asked the attempt to stop between chunks
 */
enum class ErrorKind {
    ConfigurationIncomplete,
    AuthConsentRequired,
    FileNotFound,
    SessionInvalid,
    TransientNetworkOrServer,
    ProtocolViolation,
    IntegrityMismatch,
    Storage,
    Cancelled
};

struct Error {
    ErrorKind kind = ErrorKind::TransientNetworkOrServer;
    std::string message; ///< Short, user-facing
    std::string detail;  ///< Technical diagnostics (status codes, bodies, errno text)

    /// "<Kind>: <message>", used as the history row message
    [[nodiscard]] std::string summary() const;
};

const char* to_string(ErrorKind kind) noexcept;

Error make_error(ErrorKind kind, std::string message, std::string detail = {});

} // namespace cbu
