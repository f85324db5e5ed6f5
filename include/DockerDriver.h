#ifndef DOCKER_DRIVER_H
#define DOCKER_DRIVER_H

#include <chrono>
#include <string>
#include <vector>
#include "Config.h"
#include "RuntimeDriver.h"

class Logger;
struct ProcessResult;

/**
 * @class DockerDriver
 * @brief RuntimeDriver backed by the docker CLI.
 *
 * Commands are executed through Process with argument vectors, never through
 * a shell, and each one carries the ceiling from DriverTimeouts.
 */
class DockerDriver : public RuntimeDriver {
public:
    DockerDriver(const Config& config, Logger& logger);

    DriverResult create(const LaunchRequest& request) override;
    std::optional<std::string> inspect_address(const std::string& name) override;
    bool inspect_running(const std::string& name) override;
    bool exists(const std::string& name) override;
    DriverResult stop(const std::string& name) override;
    DriverResult remove(const std::string& name) override;

    bool network_exists(const std::string& name) override;
    DriverResult network_create(const std::string& name, const std::string& subnet) override;
    DriverResult block_egress(const std::string& source_subnet, const std::string& protected_range) override;

    HostStats host_stats() override;

    // The full argument vector for `docker run`, exposed for tests.
    std::vector<std::string> build_run_args(const LaunchRequest& request) const;

private:
    DriverResult run_docker(const std::vector<std::string>& args, int timeout_seconds);
    DriverResult run_command(const std::string& command, const std::vector<std::string>& args,
                             int timeout_seconds);
    std::string probe(const std::string& command, const std::vector<std::string>& args);

    std::string binary_;
    NetworkConfig network_;
    DriverTimeouts timeouts_;
    Logger& logger_;
};

#endif // DOCKER_DRIVER_H
