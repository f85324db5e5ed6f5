#include "CleanupScheduler.h"
#include "LabController.h"
#include "Logger.h"
#include <thread>

CleanupScheduler::CleanupScheduler(LabController& controller, Logger& logger, std::chrono::seconds interval)
    : controller_(controller), logger_(logger), interval_(interval) {}

OpResult CleanupScheduler::run_once() {
    OpResult result = controller_.auto_cleanup();
    if (result.success) {
        logger_.info("Scheduler", "sweep cleaned " + result.payload.value("count", nlohmann::json(0)).dump() +
                                  " lab(s), purged " + std::to_string(result.payload.value("purged", nlohmann::json::array()).size()));
    } else {
        logger_.error("Scheduler", "sweep failed: " + result.reason);
    }
    return result;
}

int CleanupScheduler::run_until(const std::atomic<bool>& stop_flag) {
    int sweeps = 0;
    while (!stop_flag.load()) {
        run_once();
        ++sweeps;

        // Sleep in short slices so a signal is honoured promptly.
        auto wake = std::chrono::steady_clock::now() + interval_;
        while (!stop_flag.load() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    logger_.info("Scheduler", "stopped after " + std::to_string(sweeps) + " sweep(s)");
    return sweeps;
}
