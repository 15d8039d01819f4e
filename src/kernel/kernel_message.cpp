#include "kernel/kernel_message.hpp"

#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "utils/common.hpp"

namespace codebox::kernel {
namespace {

constexpr std::size_t kSignedFrames = 4;

std::string ToHex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string StringField(const nlohmann::json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return {};
}

nlohmann::json ParseFrame(const std::string& frame, const char* name) {
    try {
        return nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& ex) {
        throw MessageError(std::string("invalid ") + name + " frame: " + ex.what());
    }
}

}  // namespace

std::string KernelMessage::MsgType() const {
    return StringField(header, "msg_type");
}

std::string KernelMessage::MsgId() const {
    return StringField(header, "msg_id");
}

std::string KernelMessage::ParentMsgId() const {
    return StringField(parent_header, "msg_id");
}

MessageCodec::MessageCodec(std::string key, std::string session_id, std::string username)
    : key_(std::move(key))
    , session_id_(std::move(session_id))
    , username_(std::move(username)) {}

KernelMessage MessageCodec::NewMessage(const std::string& msg_type, nlohmann::json content) const {
    KernelMessage message;
    message.header = {
        {"msg_id", utils::GenerateUuid()},
        {"session", session_id_},
        {"username", username_},
        {"date", utils::NowIso()},
        {"msg_type", msg_type},
        {"version", kProtocolVersion}
    };
    message.content = std::move(content);
    return message;
}

std::vector<std::string> MessageCodec::Encode(const KernelMessage& message) const {
    std::vector<std::string> body = {
        message.header.dump(),
        message.parent_header.dump(),
        message.metadata.dump(),
        message.content.dump()
    };
    std::vector<std::string> frames = message.identities;
    frames.emplace_back(kDelimiter);
    frames.push_back(Sign(body));
    frames.insert(frames.end(), body.begin(), body.end());
    return frames;
}

KernelMessage MessageCodec::Decode(const std::vector<std::string>& frames) const {
    std::size_t delimiter = 0;
    while (delimiter < frames.size() && frames[delimiter] != kDelimiter) {
        ++delimiter;
    }
    if (delimiter == frames.size()) {
        throw MessageError("missing message delimiter");
    }
    if (frames.size() < delimiter + 2 + kSignedFrames) {
        throw MessageError("truncated message: " + std::to_string(frames.size()) + " frames");
    }

    const auto& signature = frames[delimiter + 1];
    const std::vector<std::string> body(frames.begin() + static_cast<std::ptrdiff_t>(delimiter + 2),
                                        frames.begin() + static_cast<std::ptrdiff_t>(delimiter + 2 + kSignedFrames));
    if (!key_.empty()) {
        const auto expected = Sign(body);
        if (expected.size() != signature.size()
            || CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) != 0) {
            throw MessageError("invalid message signature");
        }
    }

    KernelMessage message;
    message.identities.assign(frames.begin(), frames.begin() + static_cast<std::ptrdiff_t>(delimiter));
    message.header = ParseFrame(body[0], "header");
    message.parent_header = ParseFrame(body[1], "parent_header");
    message.metadata = ParseFrame(body[2], "metadata");
    message.content = ParseFrame(body[3], "content");
    return message;
}

std::string MessageCodec::Sign(const std::vector<std::string>& frames) const {
    if (key_.empty()) {
        return {};
    }
    std::unique_ptr<HMAC_CTX, decltype(&HMAC_CTX_free)> ctx(HMAC_CTX_new(), &HMAC_CTX_free);
    if (!ctx) {
        throw MessageError("failed to allocate HMAC context");
    }
    if (HMAC_Init_ex(ctx.get(), key_.data(), static_cast<int>(key_.size()), EVP_sha256(), nullptr) != 1) {
        throw MessageError("failed to initialise HMAC-SHA256");
    }
    for (const auto& frame : frames) {
        const auto* data = reinterpret_cast<const unsigned char*>(frame.data());
        if (HMAC_Update(ctx.get(), data, frame.size()) != 1) {
            throw MessageError("failed to update HMAC-SHA256");
        }
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (HMAC_Final(ctx.get(), digest, &length) != 1) {
        throw MessageError("failed to finalise HMAC-SHA256");
    }
    return ToHex(digest, length);
}

}  // namespace codebox::kernel
