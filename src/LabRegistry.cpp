#include "LabRegistry.h"
#include "Logger.h"
#include <algorithm>
#include <cstdio>
#include <set>

using json = nlohmann::json;

// ============================================================================
// STATUS MACHINE
// ============================================================================

const char* lab_status_name(LabStatus status) {
    switch (status) {
        case LabStatus::Created: return "created";
        case LabStatus::Running: return "running";
        case LabStatus::Stopped: return "stopped";
        case LabStatus::Deleted: return "deleted";
        case LabStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<LabStatus> lab_status_from_name(const std::string& name) {
    if (name == "created") return LabStatus::Created;
    if (name == "running") return LabStatus::Running;
    if (name == "stopped") return LabStatus::Stopped;
    if (name == "deleted") return LabStatus::Deleted;
    if (name == "failed") return LabStatus::Failed;
    return std::nullopt;
}

bool is_valid_transition(LabStatus from, LabStatus to) {
    switch (from) {
        case LabStatus::Created:
            return to == LabStatus::Running || to == LabStatus::Failed || to == LabStatus::Deleted;
        case LabStatus::Running:
            return to == LabStatus::Stopped || to == LabStatus::Failed;
        case LabStatus::Stopped:
        case LabStatus::Failed:
            return to == LabStatus::Deleted;
        case LabStatus::Deleted:
            return false;
    }
    return false;
}

bool counts_toward_quota(LabStatus status) {
    return status == LabStatus::Running || status == LabStatus::Created;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json LabInstance::to_json() const {
    return {
        {"owner", owner},
        {"lab_type", lab_type},
        {"container_name", name},
        {"ip_address", address},
        {"port", port},
        {"created_at", created_at},
        {"started_at", started_at},
        {"status", lab_status_name(status)},
    };
}

std::optional<LabInstance> LabInstance::from_json(const std::string& name, const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        auto status = lab_status_from_name(j.at("status").get<std::string>());
        if (!status) return std::nullopt;

        LabInstance lab;
        lab.name = name;
        lab.owner = j.at("owner").get<std::string>();
        lab.lab_type = j.at("lab_type").get<std::string>();
        lab.status = *status;
        lab.address = j.value("ip_address", "");
        lab.port = j.value("port", 0);
        lab.created_at = j.value("created_at", 0.0);
        lab.started_at = j.value("started_at", lab.created_at);
        return lab;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::vector<LabInstance> LabRegistry::parse(const json& doc, Logger* logger) {
    std::vector<LabInstance> labs;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (auto lab = LabInstance::from_json(it.key(), it.value())) {
            labs.push_back(*lab);
        } else if (logger != nullptr) {
            logger->error("PersistenceCorrupt", "skipping malformed registry entry '" + it.key() + "'");
        }
    }
    return labs;
}

// ============================================================================
// QUERIES
// ============================================================================

LabRegistry::LabRegistry(const std::string& path, Logger& logger, std::chrono::milliseconds lock_timeout)
    : store_(path, logger, lock_timeout), logger_(logger) {}

std::vector<LabInstance> LabRegistry::list() const {
    return parse(store_.load(), &logger_);
}

std::vector<LabInstance> LabRegistry::list_owned(const std::string& owner) const {
    std::vector<LabInstance> owned;
    for (auto& lab : list()) {
        if (lab.owner == owner) owned.push_back(lab);
    }
    return owned;
}

std::optional<LabInstance> LabRegistry::find(const std::string& name) const {
    json doc = store_.load();
    if (!doc.contains(name)) return std::nullopt;
    return LabInstance::from_json(name, doc[name]);
}

int LabRegistry::count_active(const std::vector<LabInstance>& labs) {
    return static_cast<int>(std::count_if(labs.begin(), labs.end(),
        [](const LabInstance& l) { return counts_toward_quota(l.status); }));
}

int LabRegistry::count_active(const std::vector<LabInstance>& labs, const std::string& owner) {
    return static_cast<int>(std::count_if(labs.begin(), labs.end(),
        [&](const LabInstance& l) { return l.owner == owner && counts_toward_quota(l.status); }));
}

// ============================================================================
// MUTATIONS
// ============================================================================

Reservation LabRegistry::reserve(const std::string& owner, const std::string& lab_type, int port,
                                 const std::string& base_name, int seed, const QuotaPolicy& quota,
                                 double now) {
    Reservation r;
    r.store_status = store_.update([&](json& doc) {
        std::vector<LabInstance> labs = parse(doc, nullptr);
        r.owner_count = count_active(labs, owner);
        r.global_count = count_active(labs);
        for (const auto& lab : labs) {
            if (lab.owner == owner && counts_toward_quota(lab.status)) {
                r.owner_lab_types.push_back(lab.lab_type);
            }
        }

        if (r.owner_count >= quota.max_per_owner) {
            r.outcome = Reservation::Outcome::OwnerQuota;
            return false;
        }
        if (r.global_count >= quota.max_total) {
            r.outcome = Reservation::Outcome::GlobalQuota;
            return false;
        }

        std::set<std::string> taken;
        for (auto it = doc.begin(); it != doc.end(); ++it) taken.insert(it.key());

        for (int i = 0; i < 10000; ++i) {
            char suffix[8];
            std::snprintf(suffix, sizeof(suffix), "%04d", (seed + i) % 10000);
            std::string candidate = base_name + "-" + suffix;
            if (taken.count(candidate) == 0) {
                r.name = candidate;
                break;
            }
        }
        if (r.name.empty()) {
            r.outcome = Reservation::Outcome::StoreError;
            return false;
        }

        LabInstance lab;
        lab.name = r.name;
        lab.owner = owner;
        lab.lab_type = lab_type;
        lab.status = LabStatus::Created;
        lab.port = port;
        lab.created_at = now;
        lab.started_at = now;
        doc[r.name] = lab.to_json();
        r.outcome = Reservation::Outcome::Reserved;
        return true;
    });

    if (r.store_status != StoreStatus::Ok) {
        r.outcome = Reservation::Outcome::StoreError;
        r.name.clear();
    }
    return r;
}

StoreStatus LabRegistry::mark_running(const std::string& name, const std::string& address, double started_at,
                                      bool* promoted) {
    if (promoted != nullptr) *promoted = false;
    return store_.update([&](json& doc) {
        if (!doc.contains(name)) {
            // A sweep purged the reservation meanwhile; nothing to promote.
            return false;
        }
        auto lab = LabInstance::from_json(name, doc[name]);
        if (!lab || !is_valid_transition(lab->status, LabStatus::Running)) {
            return false;
        }
        lab->status = LabStatus::Running;
        lab->address = address;
        lab->started_at = started_at;
        doc[name] = lab->to_json();
        if (promoted != nullptr) *promoted = true;
        return true;
    });
}

StoreStatus LabRegistry::transition(const std::string& name, LabStatus expected, LabStatus next, bool* changed) {
    if (changed != nullptr) *changed = false;
    if (!is_valid_transition(expected, next)) {
        logger_.error("Registry", std::string("rejected transition ") + lab_status_name(expected) +
                                  " -> " + lab_status_name(next) + " for " + name);
        return StoreStatus::Ok;
    }

    return store_.update([&](json& doc) {
        if (!doc.contains(name)) return false;
        auto lab = LabInstance::from_json(name, doc[name]);
        if (!lab || lab->status != expected) return false;

        if (next == LabStatus::Deleted) {
            doc.erase(name);
        } else {
            lab->status = next;
            doc[name] = lab->to_json();
        }
        if (changed != nullptr) *changed = true;
        return true;
    });
}

StoreStatus LabRegistry::erase(const std::string& name) {
    return store_.update([&](json& doc) {
        return doc.erase(name) > 0;
    });
}

StoreStatus LabRegistry::erase_all(const std::vector<std::string>& names) {
    return store_.update([&](json& doc) {
        bool removed = false;
        for (const auto& name : names) {
            if (doc.erase(name) > 0) removed = true;
        }
        return removed;
    });
}

StoreStatus LabRegistry::erase_unchanged(const std::vector<LabInstance>& snapshot, std::vector<std::string>* erased) {
    std::vector<std::string> removed;
    StoreStatus st = store_.update([&](json& doc) {
        removed.clear();
        for (const auto& seen : snapshot) {
            if (!doc.contains(seen.name)) continue;
            auto current = LabInstance::from_json(seen.name, doc[seen.name]);
            if (!current || current->status != seen.status || current->created_at != seen.created_at) {
                continue;
            }
            doc.erase(seen.name);
            removed.push_back(seen.name);
        }
        return !removed.empty();
    });

    if (st != StoreStatus::Ok) removed.clear();
    if (erased != nullptr) *erased = removed;
    return st;
}
