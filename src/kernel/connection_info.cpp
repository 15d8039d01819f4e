#include "kernel/connection_info.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

#include "utils/common.hpp"

namespace codebox::kernel {

std::vector<int> ConnectionInfo::Ports() const {
    return {shell_port, iopub_port, stdin_port, control_port, hb_port};
}

std::string ConnectionInfo::Endpoint(int port) const {
    return transport + "://" + ip + ":" + std::to_string(port);
}

nlohmann::json ConnectionInfo::ToJson() const {
    return {
        {"shell_port", shell_port},
        {"iopub_port", iopub_port},
        {"stdin_port", stdin_port},
        {"control_port", control_port},
        {"hb_port", hb_port},
        {"ip", ip},
        {"transport", transport},
        {"signature_scheme", signature_scheme},
        {"key", key},
        {"kernel_name", kernel_name}
    };
}

ConnectionInfo ConnectionInfo::FromJson(const nlohmann::json& data) {
    ConnectionInfo info;
    info.shell_port = data.value("shell_port", 0);
    info.iopub_port = data.value("iopub_port", 0);
    info.stdin_port = data.value("stdin_port", 0);
    info.control_port = data.value("control_port", 0);
    info.hb_port = data.value("hb_port", 0);
    info.ip = data.value("ip", std::string("127.0.0.1"));
    info.transport = data.value("transport", std::string("tcp"));
    info.signature_scheme = data.value("signature_scheme", std::string("hmac-sha256"));
    info.key = data.value("key", std::string());
    info.kernel_name = data.value("kernel_name", std::string());
    return info;
}

std::vector<int> AllocateFreePorts(std::size_t count) {
    namespace asio = boost::asio;
    using asio::ip::tcp;

    asio::io_context io;
    std::vector<std::unique_ptr<tcp::acceptor>> held;
    std::vector<int> ports;
    try {
        while (ports.size() < count) {
            auto acceptor = std::make_unique<tcp::acceptor>(io);
            const tcp::endpoint endpoint(asio::ip::address_v4::loopback(), 0);
            acceptor->open(endpoint.protocol());
            acceptor->bind(endpoint);
            ports.push_back(acceptor->local_endpoint().port());
            held.push_back(std::move(acceptor));
        }
    } catch (const boost::system::system_error& ex) {
        throw std::runtime_error(std::string("failed to allocate a free port: ") + ex.what());
    }
    return ports;
}

ConnectionInfo NewConnectionInfo() {
    const auto ports = AllocateFreePorts(kKernelPortCount);
    ConnectionInfo info;
    info.shell_port = ports[0];
    info.iopub_port = ports[1];
    info.stdin_port = ports[2];
    info.control_port = ports[3];
    info.hb_port = ports[4];
    info.key = utils::GenerateUuid();
    return info;
}

void WriteConnectionFile(const std::filesystem::path& path, const ConnectionInfo& info) {
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write connection file " + path.string());
    }
    output << info.ToJson().dump(2);
    if (!output) {
        throw std::runtime_error("failed writing connection file " + path.string());
    }
}

ConnectionInfo ReadConnectionFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot read connection file " + path.string());
    }
    try {
        nlohmann::json data;
        input >> data;
        return ConnectionInfo::FromJson(data);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("invalid connection file " + path.string() + ": " + ex.what());
    }
}

}  // namespace codebox::kernel
