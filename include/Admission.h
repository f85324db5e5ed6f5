#ifndef ADMISSION_H
#define ADMISSION_H

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "Config.h"
#include "JsonStore.h"
#include "OpResult.h"
#include "TimeUtil.h"

class Logger;

namespace Admission {

// ============================================================================
// PERMISSION CHECK
// ============================================================================

struct AccessDecision {
    bool allowed = false;
    bool superuser = false;
    std::string reason;   // machine-readable, e.g. "no_role"
    std::string message;  // remediation text for the requester
};

// "Operator, Officer" -> {"Operator", "Officer"}
std::vector<std::string> split_roles(const std::string& roles_csv);

/**
 * @class VerifiedStore
 * @brief Identities granted access out-of-band by an officer (verified_users.json).
 */
class VerifiedStore {
public:
    VerifiedStore(const std::string& path, Logger& logger, Clock clock = wall_clock_seconds,
                  std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(10000));

    bool contains(const std::string& identity, const std::string& numeric_id) const;
    StoreStatus grant(const std::string& identity, const std::string& numeric_id, const std::string& grantor);

private:
    JsonStore store_;
    Clock clock_;
};

class PermissionChecker {
public:
    PermissionChecker(const AccessPolicy& policy, const VerifiedStore& verified, Logger& logger);

    // Every decision, granted or denied, is written to the audit channel.
    AccessDecision check(const std::string& identity, const std::string& numeric_id,
                         const std::vector<std::string>& roles) const;

private:
    AccessPolicy policy_;
    const VerifiedStore& verified_;
    Logger& logger_;
};

// ============================================================================
// INPUT SANITIZER
// ============================================================================

struct SanitizeResult {
    bool valid = false;
    std::string cleaned;       // trimmed input when valid
    std::string reason;        // safe to show to the requester
    std::string matched_rule;  // internal only, recorded in the audit log
};

class InputSanitizer {
public:
    struct Rule {
        std::string name;
        std::string pattern;
        std::regex regex;
    };

    explicit InputSanitizer(Logger& logger);

    // Checked in order, case-insensitive, first match wins.
    static const std::vector<Rule>& default_rules();

    SanitizeResult sanitize(const std::string& input, const std::string& identity = "-") const;

private:
    Logger& logger_;
};

// ============================================================================
// RATE LIMITER
// ============================================================================

struct RateDecision {
    bool allowed = false;
    int wait_seconds = 0;
    std::optional<std::string> warning;
    int count = 0;  // requests already in the window before this one
    StoreStatus store_status = StoreStatus::Ok;
};

/**
 * @class RateLimiter
 * @brief Sliding-window limiter persisted per identity in rate_limits.json.
 *
 * State lives on disk so separate short-lived invocations share it; each
 * check is one locked read-modify-write.
 */
class RateLimiter {
public:
    RateLimiter(const RateLimitPolicy& policy, const std::string& store_path, Logger& logger,
                Clock clock = wall_clock_seconds,
                std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(10000));

    RateDecision check(const std::string& identity);

private:
    RateLimitPolicy policy_;
    JsonStore store_;
    Logger& logger_;
    Clock clock_;
};

// ============================================================================
// PIPELINE
// ============================================================================

struct Request {
    std::string identity;
    std::string numeric_id;
    std::vector<std::string> roles;
    std::optional<std::string> argument;  // free text, e.g. a lab type
};

struct Verdict {
    bool admitted = false;
    OpResult rejection;                // set when not admitted
    std::string cleaned_argument;
    std::optional<std::string> warning;
    bool superuser = false;
};

/**
 * @class AdmissionPipeline
 * @brief permission -> sanitize -> rate limit. Stops at the first failing stage.
 */
class AdmissionPipeline {
public:
    AdmissionPipeline(const PermissionChecker& permission, const InputSanitizer& sanitizer,
                      RateLimiter& rate_limiter);

    Verdict admit(const Request& request);

private:
    const PermissionChecker& permission_;
    const InputSanitizer& sanitizer_;
    RateLimiter& rate_limiter_;
};

OpResult rate_limit_rejection(const RateDecision& decision);

} // namespace Admission

#endif // ADMISSION_H
