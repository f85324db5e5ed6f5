#ifndef SECURITY_H
#define SECURITY_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <cstddef>

namespace Security {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

// Writable, size-capped, in-memory mount inside an otherwise read-only root.
struct TmpfsMount {
    std::string target;
    size_t size_mb = 50;
    bool noexec = true;
    bool nosuid = true;

    TmpfsMount(std::string t = "/tmp", size_t size = 50)
        : target(std::move(t)), size_mb(size) {}
};

enum class Capability {
    CAP_CHOWN, CAP_DAC_OVERRIDE, CAP_FOWNER, CAP_FSETID,
    CAP_KILL, CAP_SETGID, CAP_SETUID, CAP_SETPCAP,
    CAP_NET_BIND_SERVICE, CAP_NET_RAW, CAP_SYS_CHROOT,
    CAP_MKNOD, CAP_AUDIT_WRITE, CAP_SETFCAP,
};

struct SecurityConfig {
    // Privileges
    bool no_new_privileges = true;
    bool drop_capabilities = true;
    std::vector<Capability> keep_capabilities;

    // Filesystem
    bool readonly_rootfs = true;
    std::vector<TmpfsMount> tmpfs_mounts;

    SecurityConfig() {
        keep_capabilities.push_back(Capability::CAP_NET_BIND_SERVICE);
    }
};

// ============================================================================
// RUNTIME FLAG RENDERING
// ============================================================================

// "NET_BIND_SERVICE" style name as the container engine spells it.
std::string capability_name(Capability cap);
std::optional<Capability> capability_from_name(const std::string& name);

// "/tmp:rw,noexec,nosuid,size=50m"
std::string tmpfs_spec(const TmpfsMount& mount);

/**
 * @brief Renders the policy into container engine flags.
 *
 * When no tmpfs mounts are configured a default noexec /tmp is still
 * provided, since a read-only root leaves most images unable to start.
 */
std::vector<std::string> runtime_flags(const SecurityConfig& config);

} // namespace Security

#endif // SECURITY_H
