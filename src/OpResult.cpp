#include "OpResult.h"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ValidationError: return "validation_error";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::QuotaExceeded: return "quota_exceeded";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::RuntimeFailure: return "runtime_failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::PersistenceCorrupt: return "persistence_corrupt";
        case ErrorKind::AddressUnassigned: return "address_unassigned";
    }
    return "unknown";
}

OpResult OpResult::ok(nlohmann::json payload) {
    OpResult result;
    result.success = true;
    result.payload = std::move(payload);
    return result;
}

OpResult OpResult::fail(ErrorKind kind, std::string reason, nlohmann::json payload) {
    OpResult result;
    result.success = false;
    result.error = kind;
    result.reason = std::move(reason);
    result.payload = std::move(payload);
    return result;
}

nlohmann::json OpResult::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    out["success"] = success;
    if (!success) {
        out["error"] = reason;
        out["error_kind"] = error_kind_name(error);
    }
    if (payload.is_object()) {
        for (auto it = payload.begin(); it != payload.end(); ++it) {
            out[it.key()] = it.value();
        }
    }
    return out;
}
