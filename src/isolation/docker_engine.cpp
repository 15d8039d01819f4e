#include "isolation/docker_engine.hpp"

#include <deque>
#include <istream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/process.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::isolation {
namespace {

namespace asio = boost::asio;
namespace http = boost::beast::http;
namespace bp = boost::process;

constexpr std::size_t kBuildTailLines = 10;

std::string ErrorMessage(const std::string& body) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_object() && data.contains("message") && data["message"].is_string()) {
        return data["message"].get<std::string>();
    }
    return utils::Trim(body);
}

}  // namespace

DockerEngine::DockerEngine(std::string socket_path, std::string cli)
    : socket_path_(std::move(socket_path))
    , cli_(std::move(cli)) {}

bool DockerEngine::ImageExists(const std::string& image) {
    const auto response = Request(http::verb::get, "/images/" + image + "/json");
    if (response.status == 404) {
        return false;
    }
    Expect(response, {200}, "inspect image " + image);
    return true;
}

void DockerEngine::BuildImage(const std::string& image,
                              const std::string& dockerfile,
                              const std::string& context_dir) {
    const auto executable = cli_.find('/') != std::string::npos
        ? boost::filesystem::path(cli_)
        : bp::search_path(cli_);
    if (executable.empty()) {
        throw EngineError("docker CLI '" + cli_ + "' not found on PATH");
    }

    utils::LogInfo("docker", "building image " + image + " from " + dockerfile);
    std::deque<std::string> tail;
    int exit_code = -1;
    try {
        bp::ipstream output;
        bp::child child(
            executable,
            "build",
            "-f",
            dockerfile,
            "-t",
            image,
            context_dir,
            (bp::std_out & bp::std_err) > output);

        std::string line;
        while (std::getline(output, line)) {
            utils::LogDebug("docker", line);
            tail.push_back(line);
            if (tail.size() > kBuildTailLines) {
                tail.pop_front();
            }
        }
        child.wait();
        exit_code = child.exit_code();
    } catch (const bp::process_error& ex) {
        throw EngineError(std::string("failed to run docker build: ") + ex.what());
    }

    if (exit_code != 0) {
        throw EngineError("docker build exited with code " + std::to_string(exit_code) + ": "
                          + utils::Join(std::vector<std::string>(tail.begin(), tail.end()), "\n"));
    }
    utils::LogInfo("docker", "built image " + image);
}

std::string DockerEngine::CreateContainer(const ContainerSpec& spec) {
    const auto response = Request(http::verb::post,
                                  "/containers/create?name=" + spec.name,
                                  CreateBody(spec).dump());
    Expect(response, {201}, "create container " + spec.name);
    const auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (!data.is_object() || !data.contains("Id") || !data["Id"].is_string()) {
        throw EngineError("create container " + spec.name + ": response carries no Id");
    }
    return data["Id"].get<std::string>();
}

void DockerEngine::StartContainer(const std::string& id) {
    Expect(Request(http::verb::post, "/containers/" + id + "/start"), {204, 304}, "start container " + id);
}

std::string DockerEngine::ContainerStatus(const std::string& id) {
    const auto response = Request(http::verb::get, "/containers/" + id + "/json");
    Expect(response, {200}, "inspect container " + id);
    const auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_object() && data.contains("State") && data["State"].is_object()) {
        return data["State"].value("Status", std::string("unknown"));
    }
    return "unknown";
}

std::string DockerEngine::ContainerLogs(const std::string& id, int tail) {
    const auto response = Request(http::verb::get,
                                  "/containers/" + id + "/logs?stdout=1&stderr=1&tail=" + std::to_string(tail));
    Expect(response, {200}, "read logs of container " + id);
    return DemultiplexLogs(response.body);
}

void DockerEngine::StopContainer(const std::string& id, int grace_s) {
    Expect(Request(http::verb::post, "/containers/" + id + "/stop?t=" + std::to_string(grace_s)),
           {204, 304},
           "stop container " + id);
}

void DockerEngine::RemoveContainer(const std::string& id, bool force) {
    Expect(Request(http::verb::delete_, "/containers/" + id + (force ? "?force=1" : "")),
           {204},
           "remove container " + id);
}

nlohmann::json DockerEngine::CreateBody(const ContainerSpec& spec) {
    nlohmann::json env = nlohmann::json::array();
    for (const auto& [key, value] : spec.environment) {
        env.push_back(key + "=" + value);
    }

    nlohmann::json binds = nlohmann::json::array();
    for (const auto& mount : spec.mounts) {
        binds.push_back(mount.host_path + ":" + mount.container_path + (mount.read_only ? ":ro" : ":rw"));
    }

    nlohmann::json exposed = nlohmann::json::object();
    nlohmann::json port_bindings = nlohmann::json::object();
    for (const int port : spec.ports) {
        const auto key = std::to_string(port) + "/tcp";
        exposed[key] = nlohmann::json::object();
        const nlohmann::json binding = {{"HostIp", "127.0.0.1"}, {"HostPort", std::to_string(port)}};
        port_bindings[key] = nlohmann::json::array({binding});
    }

    nlohmann::json host_config = {
        {"Binds", binds},
        {"PortBindings", port_bindings},
        {"CapDrop", spec.cap_drop},
        {"CapAdd", spec.cap_add},
        {"SecurityOpt", spec.security_opt},
        {"NetworkMode", spec.network_mode},
        {"Dns", spec.dns}
    };
    if (spec.memory_bytes > 0) {
        host_config["Memory"] = spec.memory_bytes;
    }
    if (spec.nano_cpus > 0) {
        host_config["NanoCpus"] = spec.nano_cpus;
    }
    if (spec.pids_limit > 0) {
        host_config["PidsLimit"] = spec.pids_limit;
    }

    return {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"Env", env},
        {"ExposedPorts", exposed},
        {"HostConfig", host_config}
    };
}

std::string DockerEngine::DemultiplexLogs(const std::string& raw) {
    std::string text;
    std::size_t pos = 0;
    while (pos + 8 <= raw.size()) {
        const auto stream = static_cast<unsigned char>(raw[pos]);
        if (stream > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) {
            // TTY containers send plain text.
            return raw;
        }
        std::size_t size = 0;
        for (int i = 4; i < 8; ++i) {
            size = (size << 8) | static_cast<unsigned char>(raw[pos + static_cast<std::size_t>(i)]);
        }
        pos += 8;
        text.append(raw, pos, size);
        pos += size;
    }
    if (pos < raw.size() && text.empty()) {
        return raw;
    }
    return text;
}

DockerEngine::Response DockerEngine::Request(http::verb verb, const std::string& target, const std::string& body) {
    asio::io_context io;
    asio::local::stream_protocol::socket socket(io);
    boost::system::error_code ec;
    socket.connect(asio::local::stream_protocol::endpoint(socket_path_), ec);
    if (ec) {
        throw EngineError("cannot connect to docker at " + socket_path_ + ": " + ec.message());
    }

    http::request<http::string_body> request{verb, target, 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "codebox");
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();

    http::write(socket, request, ec);
    if (ec) {
        throw EngineError("docker request " + target + " failed: " + ec.message());
    }

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response, ec);
    if (ec) {
        throw EngineError("docker response for " + target + " failed: " + ec.message());
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(asio::local::stream_protocol::socket::shutdown_both, shutdown_ec);
    return Response{response.result_int(), response.body()};
}

void DockerEngine::Expect(const Response& response, std::initializer_list<unsigned> accepted, const std::string& what) {
    for (const auto code : accepted) {
        if (response.status == code) {
            return;
        }
    }
    throw EngineError(what + " failed (HTTP " + std::to_string(response.status) + "): " + ErrorMessage(response.body));
}

}  // namespace codebox::isolation
