#ifndef OP_RESULT_H
#define OP_RESULT_H

#include <string>
#include "nlohmann/json.hpp"

enum class ErrorKind {
    None,
    ValidationError,    // sanitizer rejection
    PermissionDenied,   // role or verification failure
    RateLimited,        // requester is over the sliding-window limit
    QuotaExceeded,      // per-owner or global ceiling reached
    NotFound,           // unknown lab type or missing instance
    RuntimeFailure,     // driver returned nonzero or unexpected output
    Timeout,            // driver call or lock exceeded its ceiling
    PersistenceCorrupt, // store could not be written
    AddressUnassigned,  // instance launched but the runtime gave it no address
};

const char* error_kind_name(ErrorKind kind);

/**
 * @struct OpResult
 * @brief Structured outcome of every command entry point.
 *
 * `reason` is always safe to show to the requester; internal detail goes to
 * the error channel instead.
 */
struct OpResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string reason;
    nlohmann::json payload = nlohmann::json::object();

    static OpResult ok(nlohmann::json payload = nlohmann::json::object());
    static OpResult fail(ErrorKind kind, std::string reason,
                         nlohmann::json payload = nlohmann::json::object());

    // {"success": ..., "error": ..., "error_kind": ..., ...payload}
    nlohmann::json to_json() const;
};

#endif // OP_RESULT_H
