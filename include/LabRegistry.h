#ifndef LAB_REGISTRY_H
#define LAB_REGISTRY_H

#include <optional>
#include <string>
#include <vector>
#include "Config.h"
#include "JsonStore.h"
#include "nlohmann/json.hpp"

class Logger;

// Created -> Running -> Stopped -> Deleted, with Failed reachable from Created or Running.
enum class LabStatus {
    Created,
    Running,
    Stopped,
    Deleted,
    Failed,
};

const char* lab_status_name(LabStatus status);
std::optional<LabStatus> lab_status_from_name(const std::string& name);
bool is_valid_transition(LabStatus from, LabStatus to);

// Created reserves a quota slot while the runtime is launching it.
bool counts_toward_quota(LabStatus status);

// Represents one provisioned sandbox, as persisted in active_labs.json
struct LabInstance {
    std::string name;
    std::string owner;
    std::string lab_type;
    LabStatus status = LabStatus::Created;
    std::string address;
    int port = 0;
    double created_at = 0;
    double started_at = 0;

    nlohmann::json to_json() const;
    static std::optional<LabInstance> from_json(const std::string& name, const nlohmann::json& j);
};

struct Reservation {
    enum class Outcome { Reserved, OwnerQuota, GlobalQuota, StoreError };

    Outcome outcome = Outcome::StoreError;
    std::string name;                         // assigned instance name when Reserved
    int owner_count = 0;
    int global_count = 0;
    std::vector<std::string> owner_lab_types; // the owner's active lab types
    StoreStatus store_status = StoreStatus::Ok;
};

/**
 * @class LabRegistry
 * @brief Persisted map of instance name -> LabInstance.
 *
 * The single source of truth for what the orchestrator believes exists.
 * Every mutation is a locked read-modify-write of the backing JsonStore.
 */
class LabRegistry {
public:
    LabRegistry(const std::string& path, Logger& logger,
                std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(10000));

    std::vector<LabInstance> list() const;
    std::vector<LabInstance> list_owned(const std::string& owner) const;
    std::optional<LabInstance> find(const std::string& name) const;

    /**
     * @brief Checks both ceilings and, if there is room, inserts a Created record.
     *
     * The check and the insert happen under one lock, so two creators can
     * never both take the last slot. The name is base_name + "-" + a four
     * digit disambiguator starting at seed and skipping names already taken.
     */
    Reservation reserve(const std::string& owner, const std::string& lab_type, int port,
                        const std::string& base_name, int seed, const QuotaPolicy& quota, double now);

    // Created -> Running with the runtime-assigned address.
    StoreStatus mark_running(const std::string& name, const std::string& address, double started_at,
                             bool* promoted = nullptr);

    /**
     * @brief Moves an entry to next if it is currently expected.
     * @param changed Set to whether the entry was found in the expected state.
     */
    StoreStatus transition(const std::string& name, LabStatus expected, LabStatus next, bool* changed = nullptr);

    StoreStatus erase(const std::string& name);
    StoreStatus erase_all(const std::vector<std::string>& names);

    /**
     * @brief Erases snapshot entries that still hold the same status and created_at.
     *
     * An entry re-created under the same name since the snapshot was taken is kept.
     * @param erased Set to the names actually removed.
     */
    StoreStatus erase_unchanged(const std::vector<LabInstance>& snapshot, std::vector<std::string>* erased = nullptr);

    static int count_active(const std::vector<LabInstance>& labs);
    static int count_active(const std::vector<LabInstance>& labs, const std::string& owner);

private:
    static std::vector<LabInstance> parse(const nlohmann::json& doc, Logger* logger);

    JsonStore store_;
    Logger& logger_;
};

#endif // LAB_REGISTRY_H
