#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace codebox::kernel {

inline constexpr const char* kProtocolVersion = "5.3";
inline constexpr const char* kDelimiter = "<IDS|MSG>";

class MessageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct KernelMessage {
    std::vector<std::string> identities;
    nlohmann::json header = nlohmann::json::object();
    nlohmann::json parent_header = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json content = nlohmann::json::object();

    std::string MsgType() const;
    std::string MsgId() const;
    std::string ParentMsgId() const;
};

// Builds, signs and verifies Jupyter wire messages for one client session.
class MessageCodec {
public:
    MessageCodec(std::string key, std::string session_id, std::string username = "codebox");

    KernelMessage NewMessage(const std::string& msg_type, nlohmann::json content) const;

    // [identities..., "<IDS|MSG>", signature, header, parent_header, metadata, content]
    std::vector<std::string> Encode(const KernelMessage& message) const;
    // Throws MessageError on missing frames, invalid JSON or a signature mismatch.
    KernelMessage Decode(const std::vector<std::string>& frames) const;

    // Hex HMAC-SHA256 over the given frames; empty when no key is configured.
    std::string Sign(const std::vector<std::string>& frames) const;

    const std::string& SessionId() const { return session_id_; }

private:
    std::string key_;
    std::string session_id_;
    std::string username_;
};

}  // namespace codebox::kernel
