#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::config {

struct IsolationConfig {
    std::string docker_socket = "/var/run/docker.sock";
    std::string image = "codebox-jupyter-base:latest";
    std::string dockerfile = "Dockerfile.base_image";
    std::string build_context;
    std::string connection_dir;
    std::vector<std::string> dns = {"8.8.8.8", "8.8.4.4"};
    std::string network_mode = "bridge";
    int pids_limit = 100;
    int startup_attempts = 3;
    int startup_interval_ms = 1000;
    int ready_timeout_s = 30;
    int stop_grace_s = 5;
};

struct ExecutionDefaults {
    int timeout_s = 60;
    std::string memory_limit = "2G";
    std::string cpu_limit = "1";
    std::size_t max_code_length = 10000;
    int workers = 4;
};

struct ValidationConfig {
    std::vector<std::string> disabled_rules;
    std::vector<std::string> extra_denied_packages;
    std::vector<std::string> allowed_packages;
    std::unordered_map<std::string, std::string> minimum_versions;
};

struct ReaperConfig {
    int interval_s = 60;
    int max_idle_s = 0;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    IsolationConfig isolation;
    ExecutionDefaults execution;
    ValidationConfig validation;
    ReaperConfig reaper;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace codebox::config
