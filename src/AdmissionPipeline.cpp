#include "Admission.h"

namespace Admission {

AdmissionPipeline::AdmissionPipeline(const PermissionChecker& permission, const InputSanitizer& sanitizer,
                                     RateLimiter& rate_limiter)
    : permission_(permission), sanitizer_(sanitizer), rate_limiter_(rate_limiter) {}

Verdict AdmissionPipeline::admit(const Request& request) {
    Verdict verdict;

    // 1. Permission
    AccessDecision access = permission_.check(request.identity, request.numeric_id, request.roles);
    if (!access.allowed) {
        verdict.rejection = OpResult::fail(ErrorKind::PermissionDenied, access.message,
                                           {{"reason", access.reason}});
        return verdict;
    }
    verdict.superuser = access.superuser;

    // 2. Sanitize the free-text argument before anything interprets it
    if (request.argument) {
        SanitizeResult clean = sanitizer_.sanitize(*request.argument, request.identity);
        if (!clean.valid) {
            verdict.rejection = OpResult::fail(ErrorKind::ValidationError, clean.reason);
            return verdict;
        }
        verdict.cleaned_argument = clean.cleaned;
    }

    // 3. Rate limit
    RateDecision rate = rate_limiter_.check(request.identity);
    if (!rate.allowed || rate.store_status != StoreStatus::Ok) {
        verdict.rejection = rate_limit_rejection(rate);
        return verdict;
    }
    verdict.warning = rate.warning;
    verdict.admitted = true;
    return verdict;
}

} // namespace Admission
