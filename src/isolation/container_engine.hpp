#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "utils/errors.hpp"

namespace codebox::isolation {

class EngineError : public Error {
public:
    using Error::Error;
};

struct BindMount {
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::vector<BindMount> mounts;
    // Published with the same number on the host loopback interface.
    std::vector<int> ports;
    std::int64_t memory_bytes = 0;
    std::int64_t nano_cpus = 0;
    int pids_limit = 0;
    std::vector<std::string> cap_drop = {"ALL"};
    std::vector<std::string> cap_add = {"NET_BIND_SERVICE"};
    std::vector<std::string> security_opt = {"no-new-privileges:true"};
    std::string network_mode = "bridge";
    std::vector<std::string> dns;
};

// Operations the kernel backend needs from a container runtime. All methods
// throw EngineError on failure.
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual bool ImageExists(const std::string& image) = 0;
    virtual void BuildImage(const std::string& image,
                            const std::string& dockerfile,
                            const std::string& context_dir) = 0;

    // Returns the container id.
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    virtual void StartContainer(const std::string& id) = 0;
    // "created", "running", "exited", ...
    virtual std::string ContainerStatus(const std::string& id) = 0;
    virtual std::string ContainerLogs(const std::string& id, int tail) = 0;
    virtual void StopContainer(const std::string& id, int grace_s) = 0;
    virtual void RemoveContainer(const std::string& id, bool force) = 0;
};

}  // namespace codebox::isolation
