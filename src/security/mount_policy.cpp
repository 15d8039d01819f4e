#include "security/mount_policy.hpp"

#include <system_error>

#include "utils/errors.hpp"

namespace codebox::security {

const std::vector<std::string>& DeniedHostPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "/etc", "/var", "/bin", "/sbin", "/boot", "/dev", "/proc", "/sys",
    };
    return kPrefixes;
}

const std::vector<std::string>& DeniedContainerPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "/etc", "/var", "/bin", "/sbin", "/boot", "/dev", "/proc", "/sys", "/var/run",
        "/opt/connection", "/opt/kernel",
    };
    return kPrefixes;
}

bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& prefix) {
    auto path_it = path.begin();
    for (auto prefix_it = prefix.begin(); prefix_it != prefix.end(); ++prefix_it, ++path_it) {
        if (prefix_it->empty()) {
            continue;
        }
        if (path_it == path.end() || *path_it != *prefix_it) {
            return false;
        }
    }
    return true;
}

void ValidateMount(const std::string& host_path, const std::string& container_path) {
    const std::filesystem::path container(container_path);
    if (container_path.empty() || !container.is_absolute()) {
        throw ValidationRejected("Container path must be absolute: " + container_path);
    }
    const auto container_normal = container.lexically_normal();
    for (const auto& prefix : DeniedContainerPrefixes()) {
        // Mounting over an ancestor such as "/" or "/opt" hides the directory too.
        if (IsWithin(container_normal, prefix) || IsWithin(prefix, container_normal)) {
            throw ValidationRejected("Container path not allowed: " + container_path);
        }
    }

    std::error_code ec;
    if (host_path.empty() || !std::filesystem::exists(host_path, ec)) {
        throw ValidationRejected("Host path does not exist: " + host_path);
    }
    auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(host_path, ec), ec);
    if (ec) {
        throw ValidationRejected("Host path cannot be resolved: " + host_path);
    }
    resolved = resolved.lexically_normal();
    for (const auto& prefix : DeniedHostPrefixes()) {
        // A mount of "/" exposes every system directory beneath it.
        if (IsWithin(resolved, prefix) || IsWithin(prefix, resolved)) {
            throw ValidationRejected("Host path not allowed: " + host_path);
        }
    }
}

}  // namespace codebox::security
