#ifndef NETWORK_MANAGER_H
#define NETWORK_MANAGER_H

#include <mutex>
#include <string>
#include "Config.h"
#include "OpResult.h"

class Logger;
class RuntimeDriver;

/**
 * @class NetworkManager
 * @brief Keeps the isolated lab network in place.
 */
class NetworkManager {
public:
    NetworkManager(const NetworkConfig& config, RuntimeDriver& driver, Logger& logger);

    /**
     * @brief Creates the lab network if it is missing. Idempotent.
     *
     * On first creation also installs the egress rule that keeps lab
     * traffic away from the protected range.
     */
    OpResult ensure_network();

    const std::string& network_name() const { return config_.network_name; }

private:
    NetworkConfig config_;
    RuntimeDriver& driver_;
    Logger& logger_;
    std::mutex setup_mutex_;
};

#endif // NETWORK_MANAGER_H
