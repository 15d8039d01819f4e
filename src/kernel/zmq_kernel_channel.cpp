#include "kernel/zmq_kernel_channel.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::kernel {
namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollSlice(100);
constexpr std::chrono::milliseconds kReadyRetry(1000);

std::chrono::milliseconds Remaining(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

std::string Seconds(std::chrono::milliseconds value) {
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(value).count()) + "s";
}

}  // namespace

ZmqKernelChannel::ZmqKernelChannel(ConnectionInfo info)
    : info_(std::move(info))
    , codec_(info_.key, utils::GenerateUuid())
    , context_(1) {}

ZmqKernelChannel::~ZmqKernelChannel() {
    Stop();
}

ChannelFactory ZmqKernelChannel::Factory() {
    return [](const ConnectionInfo& info) -> std::unique_ptr<KernelChannel> {
        return std::make_unique<ZmqKernelChannel>(info);
    };
}

void ZmqKernelChannel::Start() {
    EnsureRunning();
    std::lock_guard<std::mutex> lock(socket_mutex_);
    try {
        shell_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::dealer);
        shell_->set(zmq::sockopt::linger, 0);
        shell_->connect(info_.Endpoint(info_.shell_port));

        iopub_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::sub);
        iopub_->set(zmq::sockopt::linger, 0);
        iopub_->set(zmq::sockopt::subscribe, "");
        iopub_->connect(info_.Endpoint(info_.iopub_port));
    } catch (const zmq::error_t& ex) {
        throw ChannelError(std::string("failed to connect to kernel: ") + ex.what());
    }
    utils::LogDebug("kernel", "connected shell " + info_.Endpoint(info_.shell_port)
                    + ", iopub " + info_.Endpoint(info_.iopub_port));
}

void ZmqKernelChannel::WaitForReady(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        EnsureRunning();
        const auto request = codec_.NewMessage("kernel_info_request", nlohmann::json::object());
        {
            std::lock_guard<std::mutex> lock(socket_mutex_);
            if (!shell_) {
                throw ChannelError("kernel channel not started");
            }
            try {
                Send(*shell_, request);
            } catch (const zmq::error_t& ex) {
                throw ChannelError(std::string("failed to send kernel_info_request: ") + ex.what());
            }
        }

        const auto attempt_end = std::min(deadline, Clock::now() + kReadyRetry);
        while (Clock::now() < attempt_end) {
            EnsureRunning();
            std::vector<std::string> frames;
            {
                std::lock_guard<std::mutex> lock(socket_mutex_);
                if (!shell_) {
                    throw ChannelError("kernel channel stopped");
                }
                try {
                    frames = Receive(*shell_, std::min(kPollSlice, Remaining(attempt_end)));
                } catch (const zmq::error_t& ex) {
                    throw ChannelError(std::string("shell receive failed: ") + ex.what());
                }
            }
            if (frames.empty()) {
                continue;
            }
            try {
                const auto reply = codec_.Decode(frames);
                if (reply.MsgType() == "kernel_info_reply" && reply.ParentMsgId() == request.MsgId()) {
                    std::lock_guard<std::mutex> lock(socket_mutex_);
                    if (iopub_) {
                        Drain(*iopub_);
                    }
                    utils::LogDebug("kernel", "kernel ready");
                    return;
                }
            } catch (const MessageError& ex) {
                utils::LogWarn("kernel", std::string("dropping shell message: ") + ex.what());
            }
        }

        if (Clock::now() >= deadline) {
            throw ChannelTimeout("kernel did not become ready within " + Seconds(timeout));
        }
    }
}

std::string ZmqKernelChannel::Execute(const std::string& code) {
    EnsureRunning();
    const auto request = codec_.NewMessage("execute_request", {
        {"code", code},
        {"silent", false},
        {"store_history", true},
        {"user_expressions", nlohmann::json::object()},
        {"allow_stdin", false},
        {"stop_on_error", true}
    });
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (!shell_) {
        throw ChannelError("kernel channel not started");
    }
    try {
        // Replies to earlier requests are not consumed elsewhere.
        Drain(*shell_);
        Send(*shell_, request);
    } catch (const zmq::error_t& ex) {
        throw ChannelError(std::string("failed to send execute_request: ") + ex.what());
    }
    return request.MsgId();
}

KernelMessage ZmqKernelChannel::NextIopubMessage(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        EnsureRunning();
        const auto left = Remaining(deadline);
        if (left.count() == 0) {
            throw ChannelTimeout("no kernel message within " + Seconds(timeout));
        }
        std::vector<std::string> frames;
        {
            std::lock_guard<std::mutex> lock(socket_mutex_);
            if (!iopub_) {
                throw ChannelError("kernel channel stopped");
            }
            try {
                frames = Receive(*iopub_, std::min(kPollSlice, left));
            } catch (const zmq::error_t& ex) {
                throw ChannelError(std::string("iopub receive failed: ") + ex.what());
            }
        }
        if (frames.empty()) {
            continue;
        }
        try {
            return codec_.Decode(frames);
        } catch (const MessageError& ex) {
            utils::LogWarn("kernel", std::string("dropping iopub message: ") + ex.what());
        }
    }
}

void ZmqKernelChannel::Stop() {
    stopped_ = true;
    std::lock_guard<std::mutex> lock(socket_mutex_);
    try {
        if (shell_) {
            shell_->close();
        }
        if (iopub_) {
            iopub_->close();
        }
    } catch (const zmq::error_t& ex) {
        utils::LogWarn("kernel", std::string("closing kernel sockets: ") + ex.what());
    }
    shell_.reset();
    iopub_.reset();
}

void ZmqKernelChannel::Send(zmq::socket_t& socket, const KernelMessage& message) {
    const auto frames = codec_.Encode(message);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto flags = i + 1 < frames.size() ? zmq::send_flags::sndmore : zmq::send_flags::none;
        socket.send(zmq::buffer(frames[i]), flags);
    }
}

std::vector<std::string> ZmqKernelChannel::Receive(zmq::socket_t& socket, std::chrono::milliseconds wait) {
    zmq::pollitem_t items[] = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, 1, wait);
    if ((items[0].revents & ZMQ_POLLIN) == 0) {
        return {};
    }
    std::vector<std::string> frames;
    bool more = true;
    while (more) {
        zmq::message_t part;
        if (!socket.recv(part, zmq::recv_flags::none)) {
            break;
        }
        frames.emplace_back(static_cast<const char*>(part.data()), part.size());
        more = part.more();
    }
    return frames;
}

void ZmqKernelChannel::Drain(zmq::socket_t& socket) {
    while (!Receive(socket, std::chrono::milliseconds(0)).empty()) {
    }
}

void ZmqKernelChannel::EnsureRunning() const {
    if (stopped_) {
        throw ChannelError("kernel channel stopped");
    }
}

}  // namespace codebox::kernel
