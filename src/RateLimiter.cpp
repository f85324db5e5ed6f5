#include "Admission.h"
#include "Logger.h"
#include <cmath>

using json = nlohmann::json;

namespace Admission {

RateLimiter::RateLimiter(const RateLimitPolicy& policy, const std::string& store_path, Logger& logger,
                         Clock clock, std::chrono::milliseconds lock_timeout)
    : policy_(policy), store_(store_path, logger, lock_timeout), logger_(logger), clock_(std::move(clock)) {}

RateDecision RateLimiter::check(const std::string& identity) {
    RateDecision decision;
    const double now = clock_();
    const double cutoff = now - policy_.window_seconds;
    bool already_blocked = false;

    decision.store_status = store_.update([&](json& data) {
        json entry = data.contains(identity) && data[identity].is_object()
                         ? data[identity]
                         : json{{"timestamps", json::array()}, {"blocked_until", nullptr}, {"warned", false}};

        // Drop timestamps that left the window
        std::vector<double> timestamps;
        if (entry.contains("timestamps") && entry["timestamps"].is_array()) {
            for (const auto& t : entry["timestamps"]) {
                if (t.is_number() && t.get<double>() > cutoff) {
                    timestamps.push_back(t.get<double>());
                }
            }
        }
        entry["timestamps"] = timestamps;
        bool warned = entry.value("warned", false);

        // Active block
        if (entry.contains("blocked_until") && entry["blocked_until"].is_number()) {
            double blocked_until = entry["blocked_until"].get<double>();
            if (now < blocked_until) {
                decision.wait_seconds = static_cast<int>(std::ceil(blocked_until - now));
                already_blocked = true;
                data[identity] = entry;
                return true;
            }
        }

        int count = static_cast<int>(timestamps.size());
        decision.count = count;

        // Hard limit: block for the configured duration
        if (count >= policy_.hard) {
            entry["blocked_until"] = now + policy_.block_seconds;
            entry["warned"] = false;
            decision.wait_seconds = policy_.block_seconds;
            data[identity] = entry;
            logger_.audit(Logger::Level::Warning, "RATE_LIMIT_EXCEEDED", identity,
                          "Count: " + std::to_string(count));
            return true;
        }

        // Record this request
        timestamps.push_back(now);
        entry["timestamps"] = timestamps;
        entry["blocked_until"] = nullptr;

        if (count >= policy_.warn && !warned) {
            decision.warning = "You're sending commands quickly. Please slow down.";
            entry["warned"] = true;
        } else if (count < policy_.soft) {
            entry["warned"] = false;
        }

        decision.allowed = true;
        data[identity] = entry;
        return true;
    });

    if (already_blocked) {
        logger_.audit(Logger::Level::Warning, "RATE_LIMIT_BLOCKED", identity,
                      "Wait: " + std::to_string(decision.wait_seconds) + "s");
    }
    if (decision.store_status == StoreStatus::LockTimeout) {
        decision.allowed = false;
    }
    return decision;
}

OpResult rate_limit_rejection(const RateDecision& decision) {
    if (decision.store_status == StoreStatus::LockTimeout) {
        return OpResult::fail(ErrorKind::Timeout, "Too busy right now. Try again.");
    }
    if (decision.store_status == StoreStatus::WriteFailed) {
        return OpResult::fail(ErrorKind::PersistenceCorrupt, "Request could not be recorded. Contact admin.");
    }
    return OpResult::fail(ErrorKind::RateLimited,
                          "You're sending commands too quickly. Try again in " +
                              std::to_string(decision.wait_seconds) + " seconds.",
                          {{"wait_seconds", decision.wait_seconds}, {"rate_limited", true}});
}

} // namespace Admission
