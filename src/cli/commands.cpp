#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "gateway/app_context.hpp"
#include "gateway/http_routes.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/errors.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

bool ReadFile(const std::filesystem::path& path, std::string& content) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

int RunGateway() {
    auto config = codebox::config::LoadConfig();
    const auto host = config.gateway.host;
    const int port = config.gateway.port;

    codebox::gateway::AppContext context(std::move(config));
    try {
        context.Startup();
    } catch (const codebox::Error& ex) {
        std::cerr << "[gateway] startup failed: " << ex.what() << std::endl;
        return 1;
    }

    httplib::Server http_server;
    codebox::gateway::RegisterRoutes(http_server, context);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        const bool ok = http_server.listen(host, port);
        if (!ok) {
            std::cerr << "[gateway] http server failed to listen on " << host << ":" << port << std::endl;
            listen_failed = true;
        }
    });

    std::cout << "codebox gateway listening on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    context.Shutdown();
    return listen_failed.load() ? 1 : 0;
}

int RunValidate(const std::string& file) {
    std::string code;
    if (!ReadFile(file, code)) {
        std::cout << "Cannot read " << file << std::endl;
        return 1;
    }
    const auto config = codebox::config::LoadConfig();
    const auto validator = codebox::security::CodeValidator::FromConfig(config.validation);
    const auto verdict = validator.Validate(code);
    std::cout << (verdict.ok ? "OK: " : "REJECTED: ") << verdict.message << std::endl;
    return verdict.ok ? 0 : 2;
}

void PrintResult(const codebox::session::Result& result) {
    for (const auto& output : result.outputs) {
        if (output.type == "stream" && output.name == "stderr") {
            std::cerr << output.content;
        } else {
            std::cout << output.content;
            if (output.type == "result") {
                std::cout << std::endl;
            }
        }
    }
    for (const auto& file : result.files) {
        std::cout << "[" << file.mime_type << ", " << file.data.size() << " base64 bytes]" << std::endl;
    }
    if (result.error) {
        std::cerr << result.error->name << ": " << result.error->message << std::endl;
        for (const auto& line : result.error->traceback) {
            std::cerr << line << std::endl;
        }
    }
}

int RunFile(const std::string& file, const std::vector<std::string>& dependencies) {
    std::string code;
    if (!ReadFile(file, code)) {
        std::cout << "Cannot read " << file << std::endl;
        return 1;
    }

    codebox::gateway::AppContext context(codebox::config::LoadConfig());
    const auto code_verdict = context.Validator().Validate(code);
    if (!code_verdict.ok) {
        std::cout << "REJECTED: " << code_verdict.message << std::endl;
        return 2;
    }
    const auto deps_verdict = context.Validator().ValidatePackages(dependencies);
    if (!deps_verdict.ok) {
        std::cout << "REJECTED: " << deps_verdict.message << std::endl;
        return 2;
    }

    auto& service = context.Service();
    std::string session_id;
    try {
        context.Startup();
        codebox::session::ResourceOptions options;
        options.timeout_s = service.Defaults().timeout_s;
        options.memory_limit = service.Defaults().memory_limit;
        options.cpu_limit = service.Defaults().cpu_limit;
        session_id = service.CreateSession(dependencies, options);
        const auto request_id = service.CreateExecutionRequest(code, session_id);
        service.ExecuteCode(request_id);

        const auto result = service.GetResult(request_id);
        service.CleanupSession(session_id);
        if (!result) {
            std::cout << "No result for request " << request_id << std::endl;
            return 1;
        }
        PrintResult(*result);
        return result->status == codebox::session::ExecutionStatus::kCompleted ? 0 : 3;
    } catch (const codebox::Error& ex) {
        std::cout << ex.what() << std::endl;
        if (!session_id.empty()) {
            service.CleanupSession(session_id);
        }
        return 1;
    }
}

void PrintUsage() {
    std::cout << "Usage: codebox_cli gateway | codebox_cli validate <file> | "
                 "codebox_cli run <file> [dependency...]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];

    if (command == "gateway") {
        return RunGateway();
    }

    if (command == "validate" && argc >= 3) {
        return RunValidate(argv[2]);
    }

    if (command == "run" && argc >= 3) {
        std::vector<std::string> dependencies(argv + 3, argv + argc);
        return RunFile(argv[2], dependencies);
    }

    PrintUsage();
    return 1;
}
