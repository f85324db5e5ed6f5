#ifndef RUNTIME_DRIVER_H
#define RUNTIME_DRIVER_H

#include <map>
#include <optional>
#include <string>
#include "Config.h"

enum class DriverStatus {
    Ok,
    Failed,    // nonzero exit or the command could not be started
    TimedOut,  // ceiling elapsed; the child was killed
};

struct DriverResult {
    DriverStatus status = DriverStatus::Failed;
    int exit_code = -1;
    std::string output;
    std::string error_output;

    bool ok() const { return status == DriverStatus::Ok; }
    bool timed_out() const { return status == DriverStatus::TimedOut; }

    static DriverResult success(std::string out = "") {
        DriverResult r;
        r.status = DriverStatus::Ok;
        r.exit_code = 0;
        r.output = std::move(out);
        return r;
    }
    static DriverResult failure(std::string err, int code = 1) {
        DriverResult r;
        r.status = DriverStatus::Failed;
        r.exit_code = code;
        r.error_output = std::move(err);
        return r;
    }
    static DriverResult timeout() {
        DriverResult r;
        r.status = DriverStatus::TimedOut;
        r.error_output = "timed out";
        return r;
    }
};

// Everything the runtime needs to launch one lab instance.
struct LaunchRequest {
    std::string name;
    std::string image;
    std::string network;
    ResourceProfile resources;
    Security::SecurityConfig security;
    std::map<std::string, std::string> labels;
};

struct HostStats {
    std::string disk = "unknown";
    std::string cpu_cores = "unknown";
    std::string memory = "unknown";
    std::string gpu = "N/A";
};

/**
 * @class RuntimeDriver
 * @brief The container engine as seen by the lifecycle controller.
 *
 * Every call is blocking and bounded by a timeout chosen by the
 * implementation. Queries that fail or time out answer "absent"/"not
 * running"; the reconciler treats that answer as authoritative.
 */
class RuntimeDriver {
public:
    virtual ~RuntimeDriver() = default;

    virtual DriverResult create(const LaunchRequest& request) = 0;
    virtual std::optional<std::string> inspect_address(const std::string& name) = 0;
    virtual bool inspect_running(const std::string& name) = 0;
    virtual bool exists(const std::string& name) = 0;
    virtual DriverResult stop(const std::string& name) = 0;
    virtual DriverResult remove(const std::string& name) = 0;

    virtual bool network_exists(const std::string& name) = 0;
    virtual DriverResult network_create(const std::string& name, const std::string& subnet) = 0;
    // Drops traffic from source_subnet to protected_range. Idempotent.
    virtual DriverResult block_egress(const std::string& source_subnet, const std::string& protected_range) = 0;

    virtual HostStats host_stats() = 0;
};

#endif // RUNTIME_DRIVER_H
