#ifndef RECONCILER_H
#define RECONCILER_H

#include <string>
#include <vector>
#include "LabRegistry.h"

class Logger;
class RuntimeDriver;

/**
 * @class Reconciler
 * @brief Corrects registry drift against what the runtime actually reports.
 *
 * An entry is believed Running only until the runtime contradicts it. A
 * negative or failed liveness query wins over the persisted status.
 */
class Reconciler {
public:
    Reconciler(RuntimeDriver& driver, LabRegistry& registry, Logger& logger);

    bool is_alive(const std::string& name);

    /**
     * @brief Downgrades every Running candidate the runtime does not report running.
     * @return Names that were downgraded to Stopped.
     */
    std::vector<std::string> reconcile(const std::vector<LabInstance>& candidates);

    /**
     * @brief Removes entries whose backing container no longer exists at all.
     *
     * Created reservations younger than created_grace_seconds belong to a
     * create still in flight and are left alone.
     * @return Names purged from the registry.
     */
    std::vector<std::string> purge_missing(const std::vector<LabInstance>& candidates, double now,
                                           double created_grace_seconds);

private:
    RuntimeDriver& driver_;
    LabRegistry& registry_;
    Logger& logger_;
};

#endif // RECONCILER_H
