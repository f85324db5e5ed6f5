#include "NetworkManager.h"
#include "Logger.h"
#include "RuntimeDriver.h"

NetworkManager::NetworkManager(const NetworkConfig& config, RuntimeDriver& driver, Logger& logger)
    : config_(config), driver_(driver), logger_(logger) {}

OpResult NetworkManager::ensure_network() {
    std::lock_guard<std::mutex> lock(setup_mutex_);

    if (driver_.network_exists(config_.network_name)) {
        logger_.info("Network", "Using existing network: " + config_.network_name);
        return OpResult::ok();
    }

    logger_.info("Network", "Creating network " + config_.network_name + " (" + config_.subnet + ")");
    DriverResult created = driver_.network_create(config_.network_name, config_.subnet);
    if (!created.ok()) {
        // Another orchestrator process may have won the race.
        if (driver_.network_exists(config_.network_name)) {
            return OpResult::ok();
        }
        logger_.error("Network", "failed to create " + config_.network_name + ": " + created.error_output);
        return OpResult::fail(created.timed_out() ? ErrorKind::Timeout : ErrorKind::RuntimeFailure,
                              "Failed to create lab network. Contact admin.");
    }

    DriverResult blocked = driver_.block_egress(config_.subnet, config_.protected_range);
    if (!blocked.ok()) {
        logger_.error("Network", "egress rule toward " + config_.protected_range +
                                 " not installed: " + blocked.error_output);
    }

    logger_.audit(Logger::Level::Info, "NETWORK_CREATED", "system",
                  config_.network_name + " (" + config_.subnet + ")");
    return OpResult::ok();
}
