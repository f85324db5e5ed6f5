#include "Admission.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace Admission {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static std::string join(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out + "]";
}

std::vector<std::string> split_roles(const std::string& roles_csv) {
    std::vector<std::string> roles;
    size_t start = 0;
    while (start <= roles_csv.size()) {
        size_t comma = roles_csv.find(',', start);
        if (comma == std::string::npos) comma = roles_csv.size();
        std::string role = trim(roles_csv.substr(start, comma - start));
        if (!role.empty()) roles.push_back(role);
        start = comma + 1;
    }
    return roles;
}

// ============================================================================
// VERIFIED STORE
// ============================================================================

VerifiedStore::VerifiedStore(const std::string& path, Logger& logger, Clock clock,
                             std::chrono::milliseconds lock_timeout)
    : store_(path, logger, lock_timeout), clock_(std::move(clock)) {}

bool VerifiedStore::contains(const std::string& identity, const std::string& numeric_id) const {
    json verified = store_.load();
    return (!numeric_id.empty() && verified.contains(numeric_id)) ||
           (!identity.empty() && verified.contains(identity));
}

StoreStatus VerifiedStore::grant(const std::string& identity, const std::string& numeric_id,
                                 const std::string& grantor) {
    const std::string key = numeric_id.empty() ? identity : numeric_id;
    double now = clock_();
    return store_.update([&](json& verified) {
        verified[key] = {
            {"username", identity},
            {"verified_at", format_iso8601(now)},
            {"verified_by", grantor},
        };
        return true;
    });
}

// ============================================================================
// PERMISSION CHECKER
// ============================================================================

PermissionChecker::PermissionChecker(const AccessPolicy& policy, const VerifiedStore& verified, Logger& logger)
    : policy_(policy), verified_(verified), logger_(logger) {}

AccessDecision PermissionChecker::check(const std::string& identity, const std::string& numeric_id,
                                        const std::vector<std::string>& roles) const {
    AccessDecision decision;

    if (is_numeric(numeric_id) &&
        std::find(policy_.superusers.begin(), policy_.superusers.end(), numeric_id) != policy_.superusers.end()) {
        logger_.audit(Logger::Level::Info, "ACCESS_GRANTED (admin)", identity, "ID: " + numeric_id);
        decision.allowed = true;
        decision.superuser = true;
        return decision;
    }

    for (const auto& role : roles) {
        if (std::find(policy_.allowed_roles.begin(), policy_.allowed_roles.end(), role) != policy_.allowed_roles.end()) {
            logger_.audit(Logger::Level::Info, "ACCESS_GRANTED", identity, "Roles: " + join(roles));
            decision.allowed = true;
            return decision;
        }
    }

    if (verified_.contains(identity, numeric_id)) {
        logger_.audit(Logger::Level::Info, "ACCESS_GRANTED (verified)", identity, "ID: " + numeric_id);
        decision.allowed = true;
        return decision;
    }

    logger_.audit(Logger::Level::Warning, "UNVERIFIED_ACCESS", identity,
                  "ID: " + numeric_id + " Roles: " + join(roles));
    decision.reason = "no_role";
    decision.message =
        "You need to be verified to use CTF labs.\n\n"
        "To get access:\n"
        "1. Contact the officers in the server\n"
        "2. They'll give you the " + (policy_.allowed_roles.empty() ? std::string("member") : policy_.allowed_roles.front()) +
        " role\n"
        "3. Then you can start labs!";
    return decision;
}

} // namespace Admission
