#include "config/config_loader.hpp"

#include <exception>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("isolation") && data["isolation"].is_object()) {
        const auto& isolation = data["isolation"];
        ReadString(isolation, "dockerSocket", config.isolation.docker_socket);
        ReadString(isolation, "image", config.isolation.image);
        ReadString(isolation, "dockerfile", config.isolation.dockerfile);
        ReadString(isolation, "buildContext", config.isolation.build_context);
        ReadString(isolation, "connectionDir", config.isolation.connection_dir);
        ReadString(isolation, "networkMode", config.isolation.network_mode);
        ReadStringList(isolation, "dns", config.isolation.dns);
        ReadInt(isolation, "pidsLimit", config.isolation.pids_limit);
        ReadInt(isolation, "startupAttempts", config.isolation.startup_attempts);
        ReadInt(isolation, "startupIntervalMs", config.isolation.startup_interval_ms);
        ReadInt(isolation, "readyTimeoutS", config.isolation.ready_timeout_s);
        ReadInt(isolation, "stopGraceS", config.isolation.stop_grace_s);
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadInt(execution, "timeoutS", config.execution.timeout_s);
        ReadString(execution, "memoryLimit", config.execution.memory_limit);
        ReadString(execution, "cpuLimit", config.execution.cpu_limit);
        ReadInt(execution, "workers", config.execution.workers);
        if (execution.contains("maxCodeLength") && execution["maxCodeLength"].is_number_unsigned()) {
            config.execution.max_code_length = execution["maxCodeLength"].get<std::size_t>();
        }
    }

    if (data.contains("validation") && data["validation"].is_object()) {
        const auto& validation = data["validation"];
        ReadStringList(validation, "disabledRules", config.validation.disabled_rules);
        ReadStringList(validation, "extraDeniedPackages", config.validation.extra_denied_packages);
        ReadStringList(validation, "allowedPackages", config.validation.allowed_packages);
        if (validation.contains("minimumVersions") && validation["minimumVersions"].is_object()) {
            for (const auto& item : validation["minimumVersions"].items()) {
                if (item.value().is_string()) {
                    config.validation.minimum_versions[item.key()] = item.value().get<std::string>();
                }
            }
        }
    }

    if (data.contains("reaper") && data["reaper"].is_object()) {
        const auto& reaper = data["reaper"];
        ReadInt(reaper, "intervalS", config.reaper.interval_s);
        ReadInt(reaper, "maxIdleS", config.reaper.max_idle_s);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadInt(gateway, "port", config.gateway.port);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto docker_socket = GetEnvFallback(
        "CODEBOX_ISOLATION__DOCKER_SOCKET",
        "CODEBOX_DOCKER_SOCKET");
    if (!docker_socket.empty()) {
        config.isolation.docker_socket = docker_socket;
    }

    const auto image = GetEnvFallback(
        "CODEBOX_ISOLATION__IMAGE",
        "CODEBOX_IMAGE");
    if (!image.empty()) {
        config.isolation.image = image;
    }

    const auto build_context = GetEnvFallback(
        "CODEBOX_ISOLATION__BUILD_CONTEXT",
        "CODEBOX_BUILD_CONTEXT");
    if (!build_context.empty()) {
        config.isolation.build_context = build_context;
    }

    const auto dns = GetEnvFallback(
        "CODEBOX_ISOLATION__DNS",
        "CODEBOX_DNS");
    if (!dns.empty()) {
        config.isolation.dns = SplitCsv(dns);
    }

    const auto pids_limit = GetEnvFallback(
        "CODEBOX_ISOLATION__PIDS_LIMIT",
        "CODEBOX_PIDS_LIMIT");
    if (!pids_limit.empty()) {
        config.isolation.pids_limit = ParseInt(pids_limit, config.isolation.pids_limit);
    }

    const auto timeout = GetEnvFallback(
        "CODEBOX_EXECUTION__TIMEOUT_S",
        "CODEBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.execution.timeout_s = ParseInt(timeout, config.execution.timeout_s);
    }

    const auto memory_limit = GetEnvFallback(
        "CODEBOX_EXECUTION__MEMORY_LIMIT",
        "CODEBOX_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        config.execution.memory_limit = memory_limit;
    }

    const auto cpu_limit = GetEnvFallback(
        "CODEBOX_EXECUTION__CPU_LIMIT",
        "CODEBOX_CPU_LIMIT");
    if (!cpu_limit.empty()) {
        config.execution.cpu_limit = cpu_limit;
    }

    const auto workers = GetEnvFallback(
        "CODEBOX_EXECUTION__WORKERS",
        "CODEBOX_WORKERS");
    if (!workers.empty()) {
        config.execution.workers = ParseInt(workers, config.execution.workers);
    }

    const auto disabled_rules = GetEnvFallback(
        "CODEBOX_VALIDATION__DISABLED_RULES",
        "CODEBOX_DISABLED_RULES");
    if (!disabled_rules.empty()) {
        config.validation.disabled_rules = SplitCsv(disabled_rules);
    }

    const auto validation_off = GetEnv("CODEBOX_VALIDATION_DISABLED");
    if (!validation_off.empty() && ParseBool(validation_off)) {
        config.validation.disabled_rules = {"all"};
    }

    const auto max_idle = GetEnvFallback(
        "CODEBOX_REAPER__MAX_IDLE_S",
        "CODEBOX_MAX_IDLE_S");
    if (!max_idle.empty()) {
        config.reaper.max_idle_s = ParseInt(max_idle, config.reaper.max_idle_s);
    }

    const auto host = GetEnvFallback(
        "CODEBOX_GATEWAY__HOST",
        "CODEBOX_HOST");
    if (!host.empty()) {
        config.gateway.host = host;
    }

    const auto port = GetEnvFallback(
        "CODEBOX_GATEWAY__PORT",
        "CODEBOX_PORT");
    if (!port.empty()) {
        config.gateway.port = ParseInt(port, config.gateway.port);
    }

    const auto level = GetEnvFallback(
        "CODEBOX_LOGGING__LEVEL",
        "CODEBOX_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto override_path = GetEnv("CODEBOX_CONFIG");
    if (!override_path.empty()) {
        return override_path;
    }
    return GetHomePath() / ".codebox" / "config.json";
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "keeping defaults, failed to parse " + path.string() + ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace codebox::config
