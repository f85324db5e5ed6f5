#ifndef CLEANUP_SCHEDULER_H
#define CLEANUP_SCHEDULER_H

#include <atomic>
#include <chrono>
#include "OpResult.h"

class LabController;
class Logger;

/**
 * @class CleanupScheduler
 * @brief Periodically invokes LabController::auto_cleanup().
 */
class CleanupScheduler {
public:
    CleanupScheduler(LabController& controller, Logger& logger, std::chrono::seconds interval);

    OpResult run_once();

    /**
     * @brief Sweeps immediately, then once per interval until stop_flag is set.
     * @return Number of sweeps performed.
     */
    int run_until(const std::atomic<bool>& stop_flag);

private:
    LabController& controller_;
    Logger& logger_;
    std::chrono::seconds interval_;
};

#endif // CLEANUP_SCHEDULER_H
