#include "ConfigParser.h"
#include "LabCatalog.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>
#include <stdexcept>
#include <pwd.h>      // For getpwnam (to get home dir with sudo)
#include "nlohmann/json.hpp"

using json = nlohmann::json;

// Helper function to get the correct home directory, even with sudo
static std::string get_real_home_dir() {
    const char* sudo_user = getenv("SUDO_USER");
    if (sudo_user != nullptr) {
        struct passwd *pw = getpwnam(sudo_user);
        if (pw != nullptr) return std::string(pw->pw_dir);
    }
    const char* home = getenv("HOME");
    if (home != nullptr) return std::string(home);
    return "/tmp";
}

Config default_config() {
    Config config;
    std::string base = get_real_home_dir() + "/.ctf-labs";
    config.data_dir = base + "/data";
    config.logs_dir = base + "/logs";
    config.labs = LabCatalog::builtin();
    return config;
}

static Security::TmpfsMount parse_mount(const json& m) {
    Security::TmpfsMount mount(m.at("target").get<std::string>(), m.value("size_mb", 50));
    mount.noexec = m.value("noexec", true);
    mount.nosuid = m.value("nosuid", true);
    return mount;
}

static ResourceProfile parse_resources(const json& r, const ResourceProfile& defaults) {
    ResourceProfile res = defaults;
    res.memory = r.value("memory", res.memory);
    res.cpus = r.value("cpus", res.cpus);
    res.pids_limit = r.value("pids_limit", res.pids_limit);
    return res;
}

static LabTypeDefinition parse_lab(const json& l, const ResourceProfile& default_resources) {
    LabTypeDefinition lab;
    lab.id = l.at("id").get<std::string>();
    lab.name = l.value("name", lab.id);
    lab.image = l.at("image").get<std::string>();
    lab.category = l.value("category", "");
    lab.difficulty = l.value("difficulty", "");
    lab.port = l.at("port").get<int>();
    lab.description = l.value("description", "");
    lab.resources = l.contains("resources") ? parse_resources(l["resources"], default_resources)
                                             : default_resources;

    if (l.contains("security")) {
        const auto& sec = l["security"];
        auto& sec_config = lab.security;
        sec_config.no_new_privileges = sec.value("no_new_privileges", true);
        sec_config.drop_capabilities = sec.value("drop_capabilities", true);
        sec_config.readonly_rootfs = sec.value("readonly_rootfs", true);
        if (sec.contains("keep_capabilities")) {
            sec_config.keep_capabilities.clear();
            for (const auto& name : sec["keep_capabilities"]) {
                auto cap = Security::capability_from_name(name.get<std::string>());
                if (!cap) {
                    throw std::invalid_argument("unknown capability '" + name.get<std::string>() +
                                                "' for lab " + lab.id);
                }
                sec_config.keep_capabilities.push_back(*cap);
            }
        }
    }
    if (l.contains("tmpfs")) {
        for (const auto& m : l["tmpfs"]) {
            lab.security.tmpfs_mounts.push_back(parse_mount(m));
        }
    }
    return lab;
}

bool ConfigParser::parse_json(const std::string& filepath, Config& out_config) {
    std::ifstream config_file(filepath);
    if (!config_file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(config_file);

        out_config.runtime_binary = data.value("runtime_binary", out_config.runtime_binary);

        if (data.contains("paths")) {
            const auto& p = data["paths"];
            out_config.data_dir = p.value("data_dir", out_config.data_dir);
            out_config.logs_dir = p.value("logs_dir", out_config.logs_dir);
        }

        if (data.contains("network")) {
            const auto& n = data["network"];
            auto& net = out_config.network;
            net.network_name = n.value("name", net.network_name);
            net.subnet = n.value("subnet", net.subnet);
            net.protected_range = n.value("protected_range", net.protected_range);
            net.firewall_chain = n.value("firewall_chain", net.firewall_chain);
            net.firewall_use_sudo = n.value("firewall_use_sudo", net.firewall_use_sudo);
        }

        if (data.contains("quota")) {
            const auto& q = data["quota"];
            out_config.quota.max_per_owner = q.value("max_per_owner", out_config.quota.max_per_owner);
            out_config.quota.max_total = q.value("max_total", out_config.quota.max_total);
            out_config.quota.ttl_hours = q.value("ttl_hours", out_config.quota.ttl_hours);
        }

        if (data.contains("rate_limit")) {
            const auto& r = data["rate_limit"];
            auto& rl = out_config.rate_limit;
            rl.soft = r.value("soft", rl.soft);
            rl.warn = r.value("warn", rl.warn);
            rl.hard = r.value("hard", rl.hard);
            rl.window_seconds = r.value("window_seconds", rl.window_seconds);
            rl.block_seconds = r.value("block_seconds", rl.block_seconds);
        }

        if (data.contains("timeouts")) {
            const auto& t = data["timeouts"];
            auto& to = out_config.timeouts;
            to.create = t.value("create", to.create);
            to.stop = t.value("stop", to.stop);
            to.remove = t.value("remove", to.remove);
            to.inspect = t.value("inspect", to.inspect);
            to.network = t.value("network", to.network);
            to.stats = t.value("stats", to.stats);
            to.owner_lock = t.value("owner_lock", to.owner_lock);
            to.store_lock = t.value("store_lock", to.store_lock);
        }

        if (data.contains("access")) {
            const auto& a = data["access"];
            if (a.contains("superusers")) {
                out_config.access.superusers = a["superusers"].get<std::vector<std::string>>();
            }
            if (a.contains("allowed_roles")) {
                out_config.access.allowed_roles = a["allowed_roles"].get<std::vector<std::string>>();
            }
        }

        if (data.contains("resources")) {
            out_config.default_resources = parse_resources(data["resources"], out_config.default_resources);
        }

        if (data.contains("labs")) {
            out_config.labs.clear();
            for (const auto& l : data["labs"]) {
                out_config.labs.push_back(parse_lab(l, out_config.default_resources));
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "Error: Failed to parse JSON config file: " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid config file: " << e.what() << std::endl;
        return false;
    }
    return true;
}

// Parses an integer environment variable into target when it lies in [min, max].
static void int_from_env(const char* name, int min, int max, int& target) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) return;
    try {
        int val = std::stoi(raw);
        if (val >= min && val <= max) {
            target = val;
        } else {
            std::cerr << "Warning: " << name << " out of range (" << min << "-" << max << "), ignoring" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Invalid value for " << name << ": " << raw << std::endl;
    }
}

void ConfigParser::apply_env(Config& config) {
    if (const char* dir = std::getenv("LABCTL_DATA_DIR")) {
        config.data_dir = dir;
    }
    if (const char* dir = std::getenv("LABCTL_LOGS_DIR")) {
        config.logs_dir = dir;
    }
    if (const char* bin = std::getenv("LABCTL_RUNTIME")) {
        config.runtime_binary = bin;
    }

    int_from_env("LABCTL_MAX_LABS_PER_USER", 1, 1000, config.quota.max_per_owner);
    int_from_env("LABCTL_MAX_TOTAL_LABS", 1, 100000, config.quota.max_total);
    int_from_env("LABCTL_RATE_SOFT", 1, 10000, config.rate_limit.soft);
    int_from_env("LABCTL_RATE_WARN", 1, 10000, config.rate_limit.warn);
    int_from_env("LABCTL_RATE_HARD", 1, 10000, config.rate_limit.hard);
    int_from_env("LABCTL_RATE_BLOCK_SECONDS", 1, 86400, config.rate_limit.block_seconds);

    if (const char* ttl = std::getenv("LABCTL_TTL_HOURS")) {
        try {
            double val = std::stod(ttl);
            if (val > 0 && val <= 24 * 30) {
                config.quota.ttl_hours = val;
            } else {
                std::cerr << "Warning: LABCTL_TTL_HOURS out of range (0-720), ignoring" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: Invalid value for LABCTL_TTL_HOURS: " << ttl << std::endl;
        }
    }
}

bool ConfigParser::validate(const Config& config) {
    if (config.data_dir.empty() || config.logs_dir.empty()) {
        std::cerr << "Validation Error: 'data_dir' and 'logs_dir' are required." << std::endl;
        return false;
    }
    if (config.quota.max_per_owner <= 0 || config.quota.max_total <= 0) {
        std::cerr << "Validation Error: quota ceilings must be positive." << std::endl;
        return false;
    }
    if (config.quota.max_per_owner > config.quota.max_total) {
        std::cerr << "Validation Error: per-owner ceiling exceeds the global ceiling." << std::endl;
        return false;
    }
    if (config.quota.ttl_hours <= 0) {
        std::cerr << "Validation Error: 'ttl_hours' must be positive." << std::endl;
        return false;
    }

    const auto& rl = config.rate_limit;
    if (rl.soft <= 0 || rl.soft > rl.warn || rl.warn > rl.hard) {
        std::cerr << "Validation Error: rate limits must satisfy 0 < soft <= warn <= hard." << std::endl;
        return false;
    }
    if (rl.window_seconds <= 0 || rl.block_seconds <= 0) {
        std::cerr << "Validation Error: rate limit window and block must be positive." << std::endl;
        return false;
    }

    const auto& to = config.timeouts;
    if (to.create <= 0 || to.stop <= 0 || to.remove <= 0 || to.inspect <= 0 ||
        to.network <= 0 || to.stats <= 0 || to.owner_lock <= 0 || to.store_lock <= 0) {
        std::cerr << "Validation Error: every timeout must be positive." << std::endl;
        return false;
    }

    if (config.labs.empty()) {
        std::cerr << "Validation Error: the lab catalog is empty." << std::endl;
        return false;
    }

    // Ids become part of container names.
    static const std::regex id_pattern("^[a-z0-9][a-z0-9-]{0,31}$");
    std::set<std::string> seen;
    for (const auto& lab : config.labs) {
        if (!std::regex_match(lab.id, id_pattern)) {
            std::cerr << "Validation Error: invalid lab id '" << lab.id << "'." << std::endl;
            return false;
        }
        if (!seen.insert(lab.id).second) {
            std::cerr << "Validation Error: duplicate lab id '" << lab.id << "'." << std::endl;
            return false;
        }
        if (lab.image.empty() || lab.port <= 0 || lab.port > 65535) {
            std::cerr << "Validation Error: lab '" << lab.id << "' needs an image and a valid port." << std::endl;
            return false;
        }
    }
    return true;
}
