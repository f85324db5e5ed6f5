#include "DockerDriver.h"
#include "Logger.h"
#include "Process.h"

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerDriver::DockerDriver(const Config& config, Logger& logger)
    : binary_(config.runtime_binary),
      network_(config.network),
      timeouts_(config.timeouts),
      logger_(logger) {}

DriverResult DockerDriver::run_command(const std::string& command, const std::vector<std::string>& args,
                                       int timeout_seconds) {
    Process process(command, args);
    logger_.info("Docker", process.describe());
    ProcessResult pr = process.run(std::chrono::seconds(timeout_seconds));

    if (pr.timed_out) {
        logger_.error("Docker", "timed out after " + std::to_string(timeout_seconds) + "s: " + process.describe());
        DriverResult r = DriverResult::timeout();
        r.output = pr.stdout_data;
        return r;
    }

    DriverResult r;
    r.exit_code = pr.exit_code;
    r.output = pr.stdout_data;
    r.error_output = pr.stderr_data;
    r.status = pr.succeeded() ? DriverStatus::Ok : DriverStatus::Failed;
    return r;
}

DriverResult DockerDriver::run_docker(const std::vector<std::string>& args, int timeout_seconds) {
    return run_command(binary_, args, timeout_seconds);
}

// ============================================================================
// INSTANCE OPERATIONS
// ============================================================================

std::vector<std::string> DockerDriver::build_run_args(const LaunchRequest& request) const {
    std::vector<std::string> args{
        "run", "-d",
        "--name", request.name,
        "--network", request.network,
        "--memory=" + request.resources.memory,
        "--cpus=" + request.resources.cpus,
        "--pids-limit=" + std::to_string(request.resources.pids_limit),
    };

    for (const auto& label : request.labels) {
        args.push_back("--label=" + label.first + "=" + label.second);
    }

    for (const auto& flag : Security::runtime_flags(request.security)) {
        args.push_back(flag);
    }

    args.push_back(request.image);
    return args;
}

DriverResult DockerDriver::create(const LaunchRequest& request) {
    return run_docker(build_run_args(request), timeouts_.create);
}

std::optional<std::string> DockerDriver::inspect_address(const std::string& name) {
    DriverResult r = run_docker({"inspect", "-f",
                                 "{{range .NetworkSettings.Networks}}{{.IPAddress}}{{end}}", name},
                                timeouts_.inspect);
    if (!r.ok()) {
        return std::nullopt;
    }
    std::string address = trim(r.output);
    if (address.empty()) {
        return std::nullopt;
    }
    return address;
}

bool DockerDriver::inspect_running(const std::string& name) {
    DriverResult r = run_docker({"inspect", "-f", "{{.State.Running}}", name}, timeouts_.inspect);
    return r.ok() && trim(r.output) == "true";
}

bool DockerDriver::exists(const std::string& name) {
    DriverResult r = run_docker({"inspect", "-f", "{{.Id}}", name}, timeouts_.inspect);
    return r.ok() && !trim(r.output).empty();
}

DriverResult DockerDriver::stop(const std::string& name) {
    // Leave the engine a few seconds less than our own ceiling for its SIGKILL fallback.
    int grace = timeouts_.stop > 5 ? timeouts_.stop - 5 : 1;
    return run_docker({"stop", "-t", std::to_string(grace), name}, timeouts_.stop);
}

DriverResult DockerDriver::remove(const std::string& name) {
    return run_docker({"rm", "-f", name}, timeouts_.remove);
}

// ============================================================================
// NETWORK OPERATIONS
// ============================================================================

bool DockerDriver::network_exists(const std::string& name) {
    return run_docker({"network", "inspect", name}, timeouts_.inspect).ok();
}

DriverResult DockerDriver::network_create(const std::string& name, const std::string& subnet) {
    return run_docker({"network", "create", "--driver", "bridge", "--subnet", subnet, name},
                      timeouts_.network);
}

DriverResult DockerDriver::block_egress(const std::string& source_subnet, const std::string& protected_range) {
    std::string command = "iptables";
    std::vector<std::string> prefix;
    if (network_.firewall_use_sudo) {
        command = "sudo";
        prefix = {"-n", "iptables"};
    }

    auto rule_args = [&](const std::string& op) {
        std::vector<std::string> args = prefix;
        args.insert(args.end(), {op, network_.firewall_chain,
                                 "-s", source_subnet, "-d", protected_range, "-j", "DROP"});
        return args;
    };

    // -C succeeds when the rule is already present
    if (run_command(command, rule_args("-C"), timeouts_.network).ok()) {
        return DriverResult::success();
    }
    return run_command(command, rule_args("-I"), timeouts_.network);
}

// ============================================================================
// HOST STATISTICS
// ============================================================================

std::string DockerDriver::probe(const std::string& command, const std::vector<std::string>& args) {
    DriverResult r = run_command(command, args, timeouts_.stats);
    if (!r.ok()) return "";
    return trim(r.output);
}

HostStats DockerDriver::host_stats() {
    HostStats stats;

    std::string disk = probe(binary_, {"system", "df", "--format", "{{.Size}}"});
    if (!disk.empty()) stats.disk = disk;

    std::string cpu = probe("nproc", {});
    if (!cpu.empty()) stats.cpu_cores = cpu;

    std::string mem = probe("free", {"-h", "--si"});
    if (!mem.empty()) stats.memory = mem;

    std::string gpu = probe("nvidia-smi", {"--query-gpu=utilization.gpu,memory.used,memory.total",
                                           "--format=csv,noheader,nounits"});
    if (!gpu.empty()) stats.gpu = gpu;

    return stats;
}
