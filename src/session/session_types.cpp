#include "session/session_types.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

#include "security/mount_policy.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"

namespace codebox::session {
namespace {

constexpr int kMinTimeoutS = 1;
constexpr int kMaxTimeoutS = 600;
constexpr double kMaxCpus = 64.0;

// Digits with at most one decimal point; nothing else.
bool ParseDecimal(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    bool seen_point = false;
    bool seen_digit = false;
    for (unsigned char c : text) {
        if (c == '.') {
            if (seen_point) {
                return false;
            }
            seen_point = true;
        } else if (std::isdigit(c)) {
            seen_digit = true;
        } else {
            return false;
        }
    }
    if (!seen_digit) {
        return false;
    }
    try {
        value = std::stod(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

}  // namespace

std::int64_t ParseMemoryLimit(const std::string& value) {
    auto text = utils::ToLower(utils::Trim(value));
    if (text.size() > 1 && text.back() == 'b' && !std::isdigit(static_cast<unsigned char>(text[text.size() - 2]))) {
        text.pop_back();
    }
    double multiplier = 1.0;
    if (!text.empty()) {
        switch (text.back()) {
            case 'b': multiplier = 1.0; text.pop_back(); break;
            case 'k': multiplier = 1024.0; text.pop_back(); break;
            case 'm': multiplier = 1024.0 * 1024.0; text.pop_back(); break;
            case 'g': multiplier = 1024.0 * 1024.0 * 1024.0; text.pop_back(); break;
            default: break;
        }
    }
    double amount = 0.0;
    // 2^63 is the first double past INT64_MAX.
    if (!ParseDecimal(text, amount) || amount <= 0.0 || amount * multiplier >= std::ldexp(1.0, 63)) {
        throw ValidationRejected("Invalid memory limit: " + value);
    }
    return static_cast<std::int64_t>(std::llround(amount * multiplier));
}

std::int64_t ParseNanoCpus(const std::string& value) {
    double cpus = 0.0;
    if (!ParseDecimal(utils::Trim(value), cpus) || cpus <= 0.0 || cpus > kMaxCpus) {
        throw ValidationRejected("Invalid CPU limit: " + value);
    }
    return static_cast<std::int64_t>(std::llround(cpus * 1e9));
}

void ValidateResourceOptions(const ResourceOptions& options) {
    if (options.timeout_s < kMinTimeoutS || options.timeout_s > kMaxTimeoutS) {
        throw ValidationRejected("Timeout must be between " + std::to_string(kMinTimeoutS)
                                 + " and " + std::to_string(kMaxTimeoutS) + " seconds");
    }
    ParseMemoryLimit(options.memory_limit);
    ParseNanoCpus(options.cpu_limit);
    for (const auto& mount : options.mount_points) {
        security::ValidateMount(mount.host_path, mount.container_path);
    }
}

}  // namespace codebox::session
