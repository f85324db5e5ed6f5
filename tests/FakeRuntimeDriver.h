#ifndef FAKE_RUNTIME_DRIVER_H
#define FAKE_RUNTIME_DRIVER_H

#include <map>
#include <mutex>
#include <set>
#include <string>
#include "RuntimeDriver.h"

/**
 * In-memory container engine. Containers get sequential addresses in
 * 172.20.0.0/16; individual calls can be told to fail or time out.
 */
class FakeRuntimeDriver : public RuntimeDriver {
public:
    struct Container {
        LaunchRequest request;
        std::string address;
        bool running = true;
    };

    // Scripted behaviour
    bool fail_create = false;
    bool timeout_create = false;
    bool create_without_address = false;
    bool fail_stop = false;
    bool fail_remove = false;
    bool fail_network_create = false;
    bool fail_block_egress = false;

    // Call counters
    int create_calls = 0;
    int stop_calls = 0;
    int remove_calls = 0;
    int network_create_calls = 0;
    int block_egress_calls = 0;

    DriverResult create(const LaunchRequest& request) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++create_calls;
        if (timeout_create) {
            // The engine may still have started it before the deadline hit.
            containers_[request.name] = Container{request, "", true};
            return DriverResult::timeout();
        }
        if (fail_create) return DriverResult::failure("image pull failed", 125);
        if (containers_.count(request.name)) return DriverResult::failure("name already in use", 125);

        Container c;
        c.request = request;
        if (!create_without_address) {
            ++next_host_;
            c.address = "172.20.0." + std::to_string(next_host_);
        }
        containers_[request.name] = c;
        return DriverResult::success("deadbeef" + std::to_string(create_calls) + "\n");
    }

    std::optional<std::string> inspect_address(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = containers_.find(name);
        if (it == containers_.end() || it->second.address.empty()) return std::nullopt;
        return it->second.address;
    }

    bool inspect_running(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = containers_.find(name);
        return it != containers_.end() && it->second.running;
    }

    bool exists(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        return containers_.count(name) > 0;
    }

    DriverResult stop(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++stop_calls;
        if (fail_stop) return DriverResult::failure("stop refused");
        auto it = containers_.find(name);
        if (it == containers_.end()) return DriverResult::failure("No such container: " + name);
        it->second.running = false;
        return DriverResult::success(name);
    }

    DriverResult remove(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++remove_calls;
        if (fail_remove) return DriverResult::failure("removal in progress");
        containers_.erase(name);
        return DriverResult::success(name);
    }

    bool network_exists(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mtx_);
        return networks_.count(name) > 0;
    }

    DriverResult network_create(const std::string& name, const std::string& subnet) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++network_create_calls;
        if (fail_network_create) return DriverResult::failure("pool overlaps with other one on this address space");
        networks_[name] = subnet;
        return DriverResult::success();
    }

    DriverResult block_egress(const std::string& source_subnet, const std::string& protected_range) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++block_egress_calls;
        if (fail_block_egress) return DriverResult::failure("sudo: a password is required");
        egress_rules_.insert(source_subnet + "->" + protected_range);
        return DriverResult::success();
    }

    HostStats host_stats() override {
        HostStats stats;
        stats.disk = "1.2GB";
        stats.cpu_cores = "8";
        stats.memory = "16G";
        return stats;
    }

    // Out-of-band changes, as if done by an operator or a host restart
    void kill_externally(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = containers_.find(name);
        if (it != containers_.end()) it->second.running = false;
    }
    void remove_externally(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx_);
        containers_.erase(name);
    }

    size_t container_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return containers_.size();
    }
    std::optional<Container> container(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = containers_.find(name);
        if (it == containers_.end()) return std::nullopt;
        return it->second;
    }
    bool has_egress_rule(const std::string& source_subnet, const std::string& protected_range) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return egress_rules_.count(source_subnet + "->" + protected_range) > 0;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, Container> containers_;
    std::map<std::string, std::string> networks_;
    std::set<std::string> egress_rules_;
    int next_host_ = 1;
};

#endif // FAKE_RUNTIME_DRIVER_H
