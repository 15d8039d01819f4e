#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace codebox::kernel {

inline constexpr std::size_t kKernelPortCount = 5;

// Jupyter connection file contents.
struct ConnectionInfo {
    int shell_port = 0;
    int iopub_port = 0;
    int stdin_port = 0;
    int control_port = 0;
    int hb_port = 0;
    std::string ip = "127.0.0.1";
    std::string transport = "tcp";
    std::string signature_scheme = "hmac-sha256";
    std::string key;
    std::string kernel_name;

    std::vector<int> Ports() const;
    std::string Endpoint(int port) const;

    nlohmann::json ToJson() const;
    static ConnectionInfo FromJson(const nlohmann::json& data);
};

// Ports that were free on the loopback interface. All sockets stay bound until
// every port is picked, so the result has no duplicates.
std::vector<int> AllocateFreePorts(std::size_t count);

// Fresh descriptor with five free ports and a random signing key.
ConnectionInfo NewConnectionInfo();

void WriteConnectionFile(const std::filesystem::path& path, const ConnectionInfo& info);
ConnectionInfo ReadConnectionFile(const std::filesystem::path& path);

}  // namespace codebox::kernel
