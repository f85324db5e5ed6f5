#ifndef LAB_CONTROLLER_H
#define LAB_CONTROLLER_H

#include <optional>
#include <string>
#include "Config.h"
#include "FileLock.h"
#include "LabCatalog.h"
#include "LabRegistry.h"
#include "OpResult.h"
#include "RuntimeDriver.h"
#include "TimeUtil.h"

class Logger;
class NetworkManager;
class Reconciler;

/**
 * @class LabController
 * @brief Lab instance lifecycle: create, stop, delete, status and cleanup sweeps.
 *
 * Quota checks and registry writes for one owner run under that owner's
 * lock file, so concurrent requests from the same owner are serialized
 * across threads and processes. Runtime calls happen outside the registry
 * lock; quota slots are held by a Created reservation meanwhile.
 */
class LabController {
public:
    LabController(const Config& config, LabRegistry& registry, RuntimeDriver& driver,
                  NetworkManager& network, Reconciler& reconciler, Logger& logger,
                  Clock clock = wall_clock_seconds);

    OpResult create_lab(const std::string& owner, const std::string& lab_type);
    OpResult stop_lab(const std::string& owner, const std::string& lab_type_or_name);
    OpResult delete_lab(const std::string& owner, const std::string& lab_type_or_name);
    OpResult status(const std::string& owner);
    OpResult list_labs() const;

    // Officer commands
    OpResult force_cleanup(const std::string& target_owner);
    OpResult auto_cleanup();
    OpResult server_stats();

    const LabCatalog& catalog() const { return catalog_; }

private:
    std::optional<FileLock> lock_owner(const std::string& owner);

    // Exact name match first, then the oldest instance of that lab type.
    std::optional<LabInstance> locate(const std::string& owner, const std::string& key, bool running_only) const;

    // Stops (when it may be running) and removes the container. Returns the failed call, if any.
    std::optional<DriverResult> teardown(const LabInstance& lab);

    // Removes a half-created container and releases its reservation.
    void rollback_create(const std::string& name, const std::string& owner);

    OpResult driver_failure(const DriverResult& result, const std::string& context,
                            const std::string& user_message);

    std::string base_name(const std::string& owner, const std::string& lab_type) const;
    double created_grace_seconds() const;

    Config config_;
    LabCatalog catalog_;
    LabRegistry& registry_;
    RuntimeDriver& driver_;
    NetworkManager& network_;
    Reconciler& reconciler_;
    Logger& logger_;
    Clock clock_;
};

#endif // LAB_CONTROLLER_H
