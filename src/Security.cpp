#include "Security.h"
#include <algorithm>
#include <cctype>

namespace Security {

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

namespace {

struct CapabilityName {
    Capability cap;
    const char* name;
};

const CapabilityName kCapabilityNames[] = {
    {Capability::CAP_CHOWN, "CHOWN"},
    {Capability::CAP_DAC_OVERRIDE, "DAC_OVERRIDE"},
    {Capability::CAP_FOWNER, "FOWNER"},
    {Capability::CAP_FSETID, "FSETID"},
    {Capability::CAP_KILL, "KILL"},
    {Capability::CAP_SETGID, "SETGID"},
    {Capability::CAP_SETUID, "SETUID"},
    {Capability::CAP_SETPCAP, "SETPCAP"},
    {Capability::CAP_NET_BIND_SERVICE, "NET_BIND_SERVICE"},
    {Capability::CAP_NET_RAW, "NET_RAW"},
    {Capability::CAP_SYS_CHROOT, "SYS_CHROOT"},
    {Capability::CAP_MKNOD, "MKNOD"},
    {Capability::CAP_AUDIT_WRITE, "AUDIT_WRITE"},
    {Capability::CAP_SETFCAP, "SETFCAP"},
};

} // namespace

std::string capability_name(Capability cap) {
    for (const auto& entry : kCapabilityNames) {
        if (entry.cap == cap) return entry.name;
    }
    return "";
}

std::optional<Capability> capability_from_name(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.rfind("CAP_", 0) == 0) {
        upper = upper.substr(4);
    }
    for (const auto& entry : kCapabilityNames) {
        if (upper == entry.name) return entry.cap;
    }
    return std::nullopt;
}

std::string tmpfs_spec(const TmpfsMount& mount) {
    std::string spec = mount.target + ":rw";
    if (mount.noexec) spec += ",noexec";
    if (mount.nosuid) spec += ",nosuid";
    if (mount.size_mb > 0) spec += ",size=" + std::to_string(mount.size_mb) + "m";
    return spec;
}

// ============================================================================
// MAIN RENDERER
// ============================================================================

std::vector<std::string> runtime_flags(const SecurityConfig& config) {
    std::vector<std::string> flags;

    if (config.no_new_privileges) {
        flags.push_back("--security-opt=no-new-privileges");
    }
    if (config.drop_capabilities) {
        flags.push_back("--cap-drop=ALL");
        for (Capability cap : config.keep_capabilities) {
            flags.push_back("--cap-add=" + capability_name(cap));
        }
    }
    if (config.readonly_rootfs) {
        flags.push_back("--read-only");
    }

    if (config.tmpfs_mounts.empty()) {
        flags.push_back("--tmpfs");
        flags.push_back(tmpfs_spec(TmpfsMount("/tmp", 50)));
    }
    for (const auto& mount : config.tmpfs_mounts) {
        flags.push_back("--tmpfs");
        flags.push_back(tmpfs_spec(mount));
    }
    return flags;
}

} // namespace Security
