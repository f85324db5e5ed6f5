#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include "Security.h"  // Include the nested isolation configuration

// Container resource ceilings, in the container engine's own notation.
struct ResourceProfile {
    std::string memory = "2g";
    std::string cpus = "1";
    int pids_limit = 100;
};

// One catalog entry: what kind of sandbox can be created.
struct LabTypeDefinition {
    std::string id;
    std::string name;
    std::string image;
    std::string category;
    std::string difficulty;
    int port = 0;
    std::string description;
    ResourceProfile resources;
    Security::SecurityConfig security;
};

struct QuotaPolicy {
    int max_per_owner = 3;
    int max_total = 50;
    double ttl_hours = 4.0;

    double ttl_seconds() const { return ttl_hours * 3600.0; }
};

struct RateLimitPolicy {
    int soft = 10;   // requests per window; dropping under it re-arms the warning
    int warn = 15;
    int hard = 20;
    int window_seconds = 60;
    int block_seconds = 60;
};

struct NetworkConfig {
    std::string network_name = "ctf-isolated";
    std::string subnet = "172.20.0.0/16";
    std::string protected_range = "10.106.195.0/24";  // egress to it is dropped
    std::string firewall_chain = "DOCKER-USER";
    bool firewall_use_sudo = true;
};

// Per-call ceilings for runtime driver commands, in seconds.
struct DriverTimeouts {
    int create = 30;
    int stop = 30;
    int remove = 15;
    int inspect = 10;
    int network = 30;
    int stats = 5;
    int owner_lock = 120;
    int store_lock = 10;
};

struct AccessPolicy {
    std::vector<std::string> superusers{"393483939194601472"};
    std::vector<std::string> allowed_roles{"Operator", "Officer"};
};

struct Config {
    // Storage
    std::string data_dir;
    std::string logs_dir;
    std::string runtime_binary = "docker";

    QuotaPolicy quota;
    RateLimitPolicy rate_limit;
    NetworkConfig network;
    DriverTimeouts timeouts;
    AccessPolicy access;
    ResourceProfile default_resources;

    // Static lab catalog
    std::vector<LabTypeDefinition> labs;

    std::string registry_path() const { return data_dir + "/active_labs.json"; }
    std::string rate_limit_path() const { return data_dir + "/rate_limits.json"; }
    std::string verified_path() const { return data_dir + "/verified_users.json"; }
    std::string locks_dir() const { return data_dir + "/locks"; }
};

// Defaults rooted in the invoking user's home directory, with the built-in catalog.
Config default_config();

#endif // CONFIG_H
