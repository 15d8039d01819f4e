#include "kernel/protocol_exchange.hpp"

#include <chrono>
#include <string>

#include "utils/logging.hpp"

namespace codebox::kernel {
namespace {

using Clock = std::chrono::steady_clock;

const char* const kRenderedKeys[] = {"image/png", "image/svg+xml", "text/html", "text/plain"};

// Multi-line representations may arrive as a list of lines.
std::optional<std::string> TextValue(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_array()) {
        std::string joined;
        for (const auto& line : value) {
            if (line.is_string()) {
                joined += line.get<std::string>();
            }
        }
        return joined;
    }
    return std::nullopt;
}

ExchangeOutput RenderedOutput(const nlohmann::json& content) {
    ExchangeOutput output;
    output.kind = ExchangeOutput::Kind::kRendered;
    const auto data = content.value("data", nlohmann::json::object());
    if (!data.is_object()) {
        return output;
    }
    for (const char* key : kRenderedKeys) {
        if (!data.contains(key)) {
            continue;
        }
        if (auto text = TextValue(data[key])) {
            output.bundle[key] = std::move(*text);
        }
    }
    return output;
}

KernelError ErrorFromContent(const nlohmann::json& content) {
    KernelError error;
    error.ename = content.value("ename", std::string());
    error.evalue = content.value("evalue", std::string());
    if (content.contains("traceback") && content["traceback"].is_array()) {
        for (const auto& line : content["traceback"]) {
            if (line.is_string()) {
                error.traceback.push_back(line.get<std::string>());
            }
        }
    }
    return error;
}

ExchangeResult Synthetic(ExchangeResult result, ExchangeEnd end, const char* name, const std::string& what) {
    result.end = end;
    result.error = KernelError{name, what, {}};
    return result;
}

}  // namespace

ExchangeResult RunExchange(KernelChannel& channel,
                           const std::string& code,
                           std::chrono::milliseconds per_message_timeout) {
    ExchangeResult result;
    try {
        const auto request_id = channel.Execute(code);
        // Only messages answering this request move the deadline.
        auto deadline = Clock::now() + per_message_timeout;
        while (true) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0) {
                throw ChannelTimeout("no kernel message for this request within "
                                     + std::to_string(per_message_timeout.count()) + "ms");
            }
            const auto message = channel.NextIopubMessage(left);
            if (message.ParentMsgId() != request_id) {
                continue;
            }
            deadline = Clock::now() + per_message_timeout;
            const auto type = message.MsgType();
            const auto& content = message.content;

            if (type == "status") {
                if (content.value("execution_state", std::string()) == "idle") {
                    result.end = ExchangeEnd::kIdle;
                    return result;
                }
            } else if (type == "stream") {
                ExchangeOutput output;
                output.kind = ExchangeOutput::Kind::kStream;
                output.stream_name = content.value("name", std::string("stdout"));
                output.text = content.value("text", std::string());
                result.outputs.push_back(std::move(output));
            } else if (type == "execute_result" || type == "display_data") {
                result.outputs.push_back(RenderedOutput(content));
            } else if (type == "error") {
                result.end = ExchangeEnd::kKernelError;
                result.error = ErrorFromContent(content);
                return result;
            } else {
                utils::LogDebug("kernel", "skipping iopub message " + type);
            }
        }
    } catch (const ChannelTimeout& ex) {
        return Synthetic(std::move(result), ExchangeEnd::kTimeout, "ExecutionTimeout", ex.what());
    } catch (const ChannelError& ex) {
        return Synthetic(std::move(result), ExchangeEnd::kChannelFailure, "ExecutionError", ex.what());
    } catch (const std::exception& ex) {
        return Synthetic(std::move(result), ExchangeEnd::kChannelFailure, "ExecutionError", ex.what());
    }
}

}  // namespace codebox::kernel
