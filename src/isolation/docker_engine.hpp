#pragma once

#include <initializer_list>
#include <string>

#include <boost/beast/http/verb.hpp>

#include "isolation/container_engine.hpp"
#include "nlohmann/json.hpp"

namespace codebox::isolation {

// Docker Engine API over the daemon's UNIX socket. Image builds shell out to
// the docker CLI.
class DockerEngine : public ContainerEngine {
public:
    explicit DockerEngine(std::string socket_path, std::string cli = "docker");

    bool ImageExists(const std::string& image) override;
    void BuildImage(const std::string& image,
                    const std::string& dockerfile,
                    const std::string& context_dir) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void StartContainer(const std::string& id) override;
    std::string ContainerStatus(const std::string& id) override;
    std::string ContainerLogs(const std::string& id, int tail) override;
    void StopContainer(const std::string& id, int grace_s) override;
    void RemoveContainer(const std::string& id, bool force) override;

    // Body of POST /containers/create.
    static nlohmann::json CreateBody(const ContainerSpec& spec);
    // Strips the 8-byte stream headers Docker puts on non-TTY log output.
    static std::string DemultiplexLogs(const std::string& raw);

private:
    struct Response {
        unsigned status = 0;
        std::string body;
    };

    Response Request(boost::beast::http::verb verb, const std::string& target, const std::string& body = "");
    // Throws EngineError unless the status is one of the accepted codes.
    static void Expect(const Response& response, std::initializer_list<unsigned> accepted, const std::string& what);

    std::string socket_path_;
    std::string cli_;
};

}  // namespace codebox::isolation
