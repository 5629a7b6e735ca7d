#ifndef INSTSHARE_ERRORS_HPP
#define INSTSHARE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    PRECONDITION,     // nothing selected, no source provided
    PACKAGING,        // archive creation failed
    PROVISIONING,     // agent missing, relay refused, port unavailable
    TRANSFER,         // retrieval interrupted or refused
    VALIDATION,       // manifest malformed or inconsistent
    MATERIALIZATION,  // destination write failed
    STORAGE           // persistence fault
};

inline const char* error_kind_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PRECONDITION: return "precondition";
        case ErrorKind::PACKAGING: return "packaging";
        case ErrorKind::PROVISIONING: return "provisioning";
        case ErrorKind::TRANSFER: return "transfer";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::MATERIALIZATION: return "materialization";
        case ErrorKind::STORAGE: return "storage";
        default: return "unknown";
    }
}

/**
 * @brief The one exception type thrown across the sharing subsystem.
 *
 * auth_code() is only set for transfers refused by a password-gated share
 * ("PASSWORD_REQUIRED" or "INVALID_PASSWORD").
 */
class SharingError : public std::runtime_error {
public:
    SharingError(ErrorKind kind, const std::string& message, std::string auth_code = {})
        : std::runtime_error(message), kind_(kind), auth_code_(std::move(auth_code)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& auth_code() const { return auth_code_; }

private:
    ErrorKind kind_;
    std::string auth_code_;
};

// Flattened copy of a SharingError that can travel through event channels.
struct ErrorRecord {
    ErrorKind kind = ErrorKind::PRECONDITION;
    std::string message;
    std::string auth_code;

    static ErrorRecord from(const SharingError& e) {
        return ErrorRecord{e.kind(), e.what(), e.auth_code()};
    }
};

// Collected failures of a teardown. Teardown never throws, it reports.
struct TeardownReport {
    std::vector<std::string> failures;

    bool clean() const { return failures.empty(); }
    void add(const std::string& step, const std::string& what) {
        failures.push_back(step + ": " + what);
    }
};

#endif // INSTSHARE_ERRORS_HPP
