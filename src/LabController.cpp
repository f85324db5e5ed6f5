#include "LabController.h"
#include "Logger.h"
#include "NetworkManager.h"
#include "Reconciler.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

// ============================================================================
// CONSTRUCTOR / HELPERS
// ============================================================================

LabController::LabController(const Config& config, LabRegistry& registry, RuntimeDriver& driver,
                             NetworkManager& network, Reconciler& reconciler, Logger& logger,
                             Clock clock)
    : config_(config),
      catalog_(config.labs),
      registry_(registry),
      driver_(driver),
      network_(network),
      reconciler_(reconciler),
      logger_(logger),
      clock_(std::move(clock)) {
    std::error_code ec;
    std::filesystem::create_directories(config_.locks_dir(), ec);
    if (ec) {
        logger_.error("LabController", "could not create " + config_.locks_dir() + ": " + ec.message());
    }
}

std::optional<FileLock> LabController::lock_owner(const std::string& owner) {
    std::string path = config_.locks_dir() + "/" + lock_file_name("owner", owner);
    return FileLock::acquire(path, std::chrono::seconds(config_.timeouts.owner_lock));
}

std::string LabController::base_name(const std::string& owner, const std::string& lab_type) const {
    // Container names allow [a-zA-Z0-9_.-]
    std::string safe;
    for (unsigned char c : owner) {
        safe += (std::isalnum(c) || c == '_' || c == '.' || c == '-') ? static_cast<char>(c) : '-';
    }
    if (safe.empty()) safe = "user";
    return lab_type + "-" + safe;
}

double LabController::created_grace_seconds() const {
    // Longest a create can legitimately hold a reservation, plus slack.
    return config_.timeouts.network * 2 + config_.timeouts.create +
           config_.timeouts.inspect + config_.timeouts.remove + 60;
}

std::optional<LabInstance> LabController::locate(const std::string& owner, const std::string& key,
                                                 bool running_only) const {
    std::vector<LabInstance> owned = registry_.list_owned(owner);
    if (running_only) {
        owned.erase(std::remove_if(owned.begin(), owned.end(),
                                   [](const LabInstance& l) { return l.status != LabStatus::Running; }),
                    owned.end());
    }

    for (const auto& lab : owned) {
        if (lab.name == key) return lab;
    }

    std::optional<LabInstance> best;
    for (const auto& lab : owned) {
        if (lab.lab_type != key) continue;
        if (!best) {
            best = lab;
            continue;
        }
        // Prefer a running instance, then the oldest one
        bool lab_running = lab.status == LabStatus::Running;
        bool best_running = best->status == LabStatus::Running;
        if ((lab_running && !best_running) ||
            (lab_running == best_running && lab.created_at < best->created_at)) {
            best = lab;
        }
    }
    return best;
}

OpResult LabController::driver_failure(const DriverResult& result, const std::string& context,
                                       const std::string& user_message) {
    logger_.error(context, "exit " + std::to_string(result.exit_code) + ": " + result.error_output);
    if (result.timed_out()) {
        return OpResult::fail(ErrorKind::Timeout, "Operation timed out. Try again.");
    }
    return OpResult::fail(ErrorKind::RuntimeFailure, user_message);
}

std::optional<DriverResult> LabController::teardown(const LabInstance& lab) {
    if (lab.status == LabStatus::Running || lab.status == LabStatus::Created) {
        DriverResult stopped = driver_.stop(lab.name);
        if (!stopped.ok() && driver_.exists(lab.name)) {
            logger_.error("Teardown", "stop " + lab.name + " failed: " + stopped.error_output);
            // rm -f below still kills it; only give up if that fails too.
        }
    }

    DriverResult removed = driver_.remove(lab.name);
    if (!removed.ok() && driver_.exists(lab.name)) {
        return removed;
    }
    return std::nullopt;
}

void LabController::rollback_create(const std::string& name, const std::string& owner) {
    DriverResult removed = driver_.remove(name);
    if (removed.ok() || !driver_.exists(name)) {
        StoreStatus st = registry_.erase(name);
        if (st != StoreStatus::Ok) {
            logger_.error("Rollback", "could not release reservation " + name + ": " + store_status_name(st));
        }
        return;
    }

    // Keep a Failed record so a later sweep retries the removal; it no longer holds quota.
    logger_.error("Rollback", "could not remove " + name + " for " + owner + ": " + removed.error_output);
    StoreStatus st = registry_.transition(name, LabStatus::Created, LabStatus::Failed);
    if (st != StoreStatus::Ok) {
        logger_.error("Rollback", "could not mark " + name + " failed: " + store_status_name(st));
    }
}

// ============================================================================
// CREATE
// ============================================================================

OpResult LabController::create_lab(const std::string& owner, const std::string& lab_type) {
    auto definition = catalog_.find(lab_type);
    if (!definition) {
        return OpResult::fail(ErrorKind::NotFound, "Unknown lab type: " + lab_type,
                              {{"available", catalog_.ids()}});
    }

    auto owner_lock = lock_owner(owner);
    if (!owner_lock) {
        return OpResult::fail(ErrorKind::Timeout, "Another request of yours is still in progress. Try again.");
    }

    // Dead instances must not count toward the quota decision below.
    reconciler_.reconcile(registry_.list_owned(owner));
    std::vector<LabInstance> all = registry_.list();
    if (LabRegistry::count_active(all) >= config_.quota.max_total) {
        reconciler_.reconcile(all);
    }

    double now = clock_();
    int seed = static_cast<int>(static_cast<long long>(now) % 10000);
    Reservation slot = registry_.reserve(owner, lab_type, definition->port, base_name(owner, lab_type),
                                         seed, config_.quota, now);

    switch (slot.outcome) {
        case Reservation::Outcome::Reserved:
            break;
        case Reservation::Outcome::OwnerQuota:
            logger_.audit(Logger::Level::Warning, "QUOTA_EXCEEDED", owner,
                          "Running: " + std::to_string(slot.owner_count) + "/" +
                          std::to_string(config_.quota.max_per_owner));
            return OpResult::fail(ErrorKind::QuotaExceeded,
                                  "You already have " + std::to_string(config_.quota.max_per_owner) + " labs running.",
                                  {{"running_labs", slot.owner_lab_types},
                                   {"running_count", slot.owner_count},
                                   {"max_per_user", config_.quota.max_per_owner}});
        case Reservation::Outcome::GlobalQuota:
            logger_.audit(Logger::Level::Warning, "CAPACITY_REACHED", owner,
                          "Active: " + std::to_string(slot.global_count) + "/" +
                          std::to_string(config_.quota.max_total));
            return OpResult::fail(ErrorKind::QuotaExceeded, "Server lab capacity reached. Try again later.",
                                  {{"active_labs", slot.global_count},
                                   {"max_labs", config_.quota.max_total}});
        case Reservation::Outcome::StoreError:
            if (slot.store_status == StoreStatus::LockTimeout) {
                return OpResult::fail(ErrorKind::Timeout, "Operation timed out. Try again.");
            }
            return OpResult::fail(ErrorKind::PersistenceCorrupt, "Could not record the lab. Contact admin.");
    }

    const std::string& name = slot.name;

    OpResult net = network_.ensure_network();
    if (!net.success) {
        StoreStatus st = registry_.erase(name);
        if (st != StoreStatus::Ok) {
            logger_.error("Create", "could not release reservation " + name + ": " + store_status_name(st));
        }
        return net;
    }

    LaunchRequest request;
    request.name = name;
    request.image = definition->image;
    request.network = network_.network_name();
    request.resources = definition->resources;
    request.security = definition->security;
    request.labels = {
        {"ctf-owner", owner},
        {"ctf-lab-type", lab_type},
        {"ctf-managed", "true"},
    };

    DriverResult launched = driver_.create(request);
    if (!launched.ok()) {
        // A timed out create may have left a container behind.
        rollback_create(name, owner);
        return driver_failure(launched, "Create " + name, "Failed to start " + lab_type + ". Check logs.");
    }

    auto address = driver_.inspect_address(name);
    if (!address) {
        logger_.error("Create " + name, "container started but no address was assigned");
        rollback_create(name, owner);
        return OpResult::fail(ErrorKind::AddressUnassigned, "Container started but no IP assigned.");
    }

    bool promoted = false;
    StoreStatus st = registry_.mark_running(name, *address, clock_(), &promoted);
    if (st != StoreStatus::Ok || !promoted) {
        logger_.error("Create " + name, std::string("could not persist running state: ") +
                                        (st != StoreStatus::Ok ? store_status_name(st) : "reservation vanished"));
        rollback_create(name, owner);
        if (st == StoreStatus::LockTimeout) {
            return OpResult::fail(ErrorKind::Timeout, "Operation timed out. Try again.");
        }
        return OpResult::fail(ErrorKind::PersistenceCorrupt, "Could not record the lab. Contact admin.");
    }

    int port = definition->port;
    logger_.audit(Logger::Level::Info, "LAB_STARTED", owner,
                  "Lab: " + name + " - IP: " + *address + ":" + std::to_string(port));

    return OpResult::ok({
        {"lab_name", name},
        {"ip_address", *address},
        {"port", port},
        {"url", "http://" + *address + ":" + std::to_string(port)},
        {"auto_cleanup_hours", config_.quota.ttl_hours},
    });
}

// ============================================================================
// STOP / DELETE
// ============================================================================

OpResult LabController::stop_lab(const std::string& owner, const std::string& lab_type_or_name) {
    auto owner_lock = lock_owner(owner);
    if (!owner_lock) {
        return OpResult::fail(ErrorKind::Timeout, "Another request of yours is still in progress. Try again.");
    }

    auto target = locate(owner, lab_type_or_name, true);
    if (!target) {
        return OpResult::fail(ErrorKind::NotFound, "You don't have a running " + lab_type_or_name + " lab.");
    }

    DriverResult stopped = driver_.stop(target->name);
    if (!stopped.ok()) {
        return driver_failure(stopped, "Stop " + target->name, "Failed to stop " + target->name + ". Try again.");
    }

    StoreStatus st = registry_.transition(target->name, LabStatus::Running, LabStatus::Stopped);
    if (st != StoreStatus::Ok) {
        logger_.error("Stop " + target->name, std::string("could not persist: ") + store_status_name(st));
        return OpResult::fail(st == StoreStatus::LockTimeout ? ErrorKind::Timeout : ErrorKind::PersistenceCorrupt,
                              "Lab stopped but its state could not be saved. Contact admin.");
    }

    logger_.audit(Logger::Level::Info, "LAB_STOPPED", owner, "Lab: " + target->name);
    return OpResult::ok({{"message", "Stopped " + target->name}, {"lab_name", target->name}});
}

OpResult LabController::delete_lab(const std::string& owner, const std::string& lab_type_or_name) {
    auto owner_lock = lock_owner(owner);
    if (!owner_lock) {
        return OpResult::fail(ErrorKind::Timeout, "Another request of yours is still in progress. Try again.");
    }

    auto target = locate(owner, lab_type_or_name, false);
    if (!target) {
        return OpResult::fail(ErrorKind::NotFound, "You don't have a " + lab_type_or_name + " lab.");
    }
    const std::string name = target->name;

    if (target->status == LabStatus::Running) {
        DriverResult stopped = driver_.stop(name);
        if (!stopped.ok() && driver_.exists(name)) {
            return driver_failure(stopped, "Delete " + name, "Failed to stop " + name + ". Try again.");
        }
        StoreStatus st = registry_.transition(name, LabStatus::Running, LabStatus::Stopped);
        if (st != StoreStatus::Ok) {
            logger_.error("Delete " + name, std::string("could not persist stop: ") + store_status_name(st));
        }
    }

    DriverResult removed = driver_.remove(name);
    if (!removed.ok() && driver_.exists(name)) {
        return driver_failure(removed, "Delete " + name, "Failed to delete " + name + ". Try again.");
    }

    StoreStatus st = registry_.erase(name);
    if (st != StoreStatus::Ok) {
        logger_.error("Delete " + name, std::string("could not erase entry: ") + store_status_name(st));
        return OpResult::fail(st == StoreStatus::LockTimeout ? ErrorKind::Timeout : ErrorKind::PersistenceCorrupt,
                              "Lab removed but its record could not be cleared. Contact admin.");
    }

    logger_.audit(Logger::Level::Info, "LAB_DELETED", owner, "Lab: " + name);
    return OpResult::ok({{"message", "Deleted " + name}, {"lab_name", name}});
}

// ============================================================================
// STATUS / LIST
// ============================================================================

OpResult LabController::status(const std::string& owner) {
    std::vector<LabInstance> owned = registry_.list_owned(owner);
    std::vector<std::string> downgraded = reconciler_.reconcile(owned);

    double now = clock_();
    double ttl_hours = config_.quota.ttl_hours;
    json active = json::array();

    for (const auto& lab : owned) {
        if (lab.status != LabStatus::Running) continue;
        if (std::find(downgraded.begin(), downgraded.end(), lab.name) != downgraded.end()) continue;

        double uptime_h = std::max(0.0, now - lab.started_at) / 3600.0;
        double remaining_h = std::max(0.0, ttl_hours - uptime_h);
        active.push_back({
            {"name", lab.name},
            {"type", lab.lab_type},
            {"ip", lab.address},
            {"port", lab.port},
            {"url", "http://" + lab.address + ":" + std::to_string(lab.port)},
            {"uptime_hours", round_one_decimal(uptime_h)},
            {"remaining_hours", round_one_decimal(remaining_h)},
        });
    }

    return OpResult::ok({{"active_labs", active}});
}

OpResult LabController::list_labs() const {
    return OpResult::ok({{"labs", catalog_.to_json()}});
}

// ============================================================================
// CLEANUP
// ============================================================================

OpResult LabController::force_cleanup(const std::string& target_owner) {
    auto owner_lock = lock_owner(target_owner);
    if (!owner_lock) {
        return OpResult::fail(ErrorKind::Timeout, "Cleanup timed out waiting for the user's labs. Try again.");
    }

    std::vector<std::string> removed;
    std::vector<std::string> failed;

    for (const auto& lab : registry_.list_owned(target_owner)) {
        if (auto failure = teardown(lab)) {
            logger_.error("ForceCleanup " + lab.name, failure->error_output);
            failed.push_back(lab.name);
            if (lab.status == LabStatus::Running || lab.status == LabStatus::Created) {
                StoreStatus st = registry_.transition(lab.name, lab.status, LabStatus::Failed);
                if (st != StoreStatus::Ok) {
                    logger_.error("ForceCleanup " + lab.name, std::string("could not mark failed: ") + store_status_name(st));
                }
            }
            continue;
        }
        removed.push_back(lab.name);
    }

    StoreStatus st = registry_.erase_all(removed);
    if (st != StoreStatus::Ok) {
        logger_.error("ForceCleanup", std::string("could not erase entries: ") + store_status_name(st));
        return OpResult::fail(st == StoreStatus::LockTimeout ? ErrorKind::Timeout : ErrorKind::PersistenceCorrupt,
                              "Labs removed but records could not be cleared. Contact admin.");
    }

    logger_.audit(Logger::Level::Info, "FORCE_CLEANUP", target_owner,
                  "Removed: " + json(removed).dump() + (failed.empty() ? "" : " - Failed: " + json(failed).dump()));
    return OpResult::ok({{"removed", removed}, {"failed", failed}, {"count", removed.size()}});
}

OpResult LabController::auto_cleanup() {
    double now = clock_();
    double ttl = config_.quota.ttl_seconds();
    json cleaned = json::array();

    for (const auto& lab : registry_.list()) {
        bool expired = lab.status == LabStatus::Running && now - lab.started_at > ttl;
        bool orphaned = lab.status == LabStatus::Failed;
        // A create that died between launch and promotion leaves its reservation behind.
        bool abandoned = lab.status == LabStatus::Created && now - lab.created_at > created_grace_seconds();
        if (!expired && !orphaned && !abandoned) continue;

        // A user operation on this owner is in flight; the next sweep will get it.
        auto owner_lock = FileLock::acquire(config_.locks_dir() + "/" + lock_file_name("owner", lab.owner),
                                            std::chrono::seconds(1));
        if (!owner_lock) continue;

        auto current = registry_.find(lab.name);
        if (!current || current->status != lab.status) continue;

        if (auto failure = teardown(*current)) {
            logger_.error("AutoCleanup " + lab.name, failure->error_output);
            continue;
        }

        StoreStatus st = registry_.erase(lab.name);
        if (st != StoreStatus::Ok) {
            logger_.error("AutoCleanup " + lab.name, std::string("could not erase entry: ") + store_status_name(st));
            continue;
        }

        if (expired) {
            double uptime_h = (now - lab.started_at) / 3600.0;
            cleaned.push_back({{"name", lab.name}, {"owner", lab.owner}, {"uptime_hours", round_one_decimal(uptime_h)}});
            logger_.audit(Logger::Level::Info, "AUTO_CLEANUP", lab.owner,
                          "Lab: " + lab.name + " - Uptime: " + json(round_one_decimal(uptime_h)).dump() + "h");
        } else if (abandoned) {
            logger_.audit(Logger::Level::Info, "AUTO_CLEANUP", lab.owner, "Lab: " + lab.name + " - removed abandoned reservation");
        } else {
            logger_.audit(Logger::Level::Info, "AUTO_CLEANUP", lab.owner, "Lab: " + lab.name + " - removed failed instance");
        }
    }

    // Drift correction, independent of age.
    std::vector<LabInstance> remaining = registry_.list();
    reconciler_.reconcile(remaining);
    std::vector<std::string> purged = reconciler_.purge_missing(registry_.list(), now, created_grace_seconds());

    return OpResult::ok({{"cleaned", cleaned}, {"count", cleaned.size()}, {"purged", purged}});
}

OpResult LabController::server_stats() {
    std::vector<LabInstance> labs = registry_.list();
    int running = static_cast<int>(std::count_if(labs.begin(), labs.end(),
        [](const LabInstance& l) { return l.status == LabStatus::Running; }));

    HostStats host = driver_.host_stats();
    return OpResult::ok({
        {"active_containers", running},
        {"max_containers", config_.quota.max_total},
        {"docker_disk", host.disk},
        {"cpu_cores", host.cpu_cores},
        {"memory", host.memory},
        {"gpu", host.gpu},
    });
}
