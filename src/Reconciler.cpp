#include "Reconciler.h"
#include "Logger.h"
#include "RuntimeDriver.h"
#include <algorithm>

Reconciler::Reconciler(RuntimeDriver& driver, LabRegistry& registry, Logger& logger)
    : driver_(driver), registry_(registry), logger_(logger) {}

bool Reconciler::is_alive(const std::string& name) {
    return driver_.inspect_running(name);
}

std::vector<std::string> Reconciler::reconcile(const std::vector<LabInstance>& candidates) {
    std::vector<std::string> downgraded;
    for (const auto& lab : candidates) {
        if (lab.status != LabStatus::Running || is_alive(lab.name)) {
            continue;
        }

        bool changed = false;
        StoreStatus st = registry_.transition(lab.name, LabStatus::Running, LabStatus::Stopped, &changed);
        if (st != StoreStatus::Ok) {
            logger_.error("Reconciler", "could not persist downgrade of " + lab.name + ": " + store_status_name(st));
            continue;
        }
        if (changed) {
            downgraded.push_back(lab.name);
            logger_.audit(Logger::Level::Warning, "LAB_RECONCILED", lab.owner,
                          "Lab: " + lab.name + " - runtime reports not running, marked stopped");
        }
    }
    return downgraded;
}

std::vector<std::string> Reconciler::purge_missing(const std::vector<LabInstance>& candidates, double now,
                                                   double created_grace_seconds) {
    std::vector<LabInstance> missing;
    for (const auto& lab : candidates) {
        if (lab.status == LabStatus::Created && now - lab.created_at < created_grace_seconds) {
            continue;
        }
        if (!driver_.exists(lab.name)) {
            missing.push_back(lab);
        }
    }

    if (missing.empty()) {
        return {};
    }

    // Entries re-reserved under the same name since the snapshot survive the erase.
    std::vector<std::string> erased;
    StoreStatus st = registry_.erase_unchanged(missing, &erased);
    if (st != StoreStatus::Ok) {
        logger_.error("Reconciler", std::string("could not purge missing entries: ") + store_status_name(st));
        return {};
    }
    for (const auto& lab : missing) {
        if (std::find(erased.begin(), erased.end(), lab.name) == erased.end()) continue;
        logger_.audit(Logger::Level::Info, "DRIFT_PURGED", lab.owner,
                      "Lab: " + lab.name + " - no longer exists in runtime");
    }
    return erased;
}
