#include "security/package_policy.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>

#include "utils/common.hpp"

namespace codebox::security {
namespace {

const char* const kDefaultDenylist[] = {
    // crypto
    "crypto", "pycrypto", "pycryptodome", "pycryptodomex", "cryptography", "pyopenssl",
    // remote access and automation
    "paramiko", "fabric", "pexpect", "selenium", "pyautogui", "pynput", "scapy",
    // OS-level access
    "psutil", "pywin32", "sh", "plumbum", "python-daemon",
    // executable builders
    "pyinstaller", "py2exe", "cx-freeze", "nuitka",
    // web frameworks
    "flask", "django", "fastapi", "tornado", "bottle", "sanic",
    // low-level FFI
    "cffi", "cython", "pybind11",
    // debuggers
    "debugpy", "pydevd", "pdbpp", "ipdb",
    // cloud SDKs
    "boto3", "botocore", "awscli", "google-cloud-storage", "google-api-python-client",
    "azure-storage-blob", "azure-identity",
};

const std::pair<const char*, const char*> kDefaultMinimumVersions[] = {
    {"pillow", "9.0.0"},
    {"requests", "2.31.0"},
    {"urllib3", "1.26.18"},
    {"numpy", "1.22.0"},
    {"jinja2", "3.1.3"},
    {"pyyaml", "5.4"},
    {"setuptools", "65.5.1"},
};

// Longest operators first so "==" is not read as "=".
const char* const kOperators[] = {"===", "==", "~=", ">=", "<=", "!=", ">", "<", "="};

struct Clause {
    std::string op;
    std::string version;
};

struct ParsedVersion {
    std::vector<long long> release;
    bool prerelease = false;
};

bool IsNameChar(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
}

std::vector<Clause> ParseClauses(const std::string& specifier) {
    std::vector<Clause> clauses;
    std::string::size_type start = 0;
    while (start <= specifier.size()) {
        auto end = specifier.find(',', start);
        if (end == std::string::npos) {
            end = specifier.size();
        }
        const auto part = utils::Trim(specifier.substr(start, end - start));
        start = end + 1;
        if (part.empty()) {
            continue;
        }
        Clause clause{"", part};
        for (const char* op : kOperators) {
            if (utils::StartsWith(part, op)) {
                clause.op = op;
                clause.version = utils::Trim(part.substr(clause.op.size()));
                break;
            }
        }
        clauses.push_back(std::move(clause));
    }
    return clauses;
}

ParsedVersion ParseVersion(const std::string& text) {
    std::string value = utils::Trim(text);
    if (!value.empty() && (value[0] == 'v' || value[0] == 'V')) {
        value.erase(0, 1);
    }
    const auto epoch = value.find('!');
    if (epoch != std::string::npos) {
        value.erase(0, epoch + 1);
    }

    ParsedVersion parsed;
    std::size_t i = 0;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
        long long component = 0;
        while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
            if (component < 100000000000000LL) {
                component = component * 10 + (value[i] - '0');
            }
            ++i;
        }
        parsed.release.push_back(component);
        if (i + 1 < value.size() && value[i] == '.'
            && std::isdigit(static_cast<unsigned char>(value[i + 1]))) {
            ++i;
            continue;
        }
        break;
    }
    const auto suffix = utils::ToLower(value.substr(i));
    parsed.prerelease = !suffix.empty() && suffix[0] != '+' && suffix.find("post") == std::string::npos;
    return parsed;
}

bool IsExactPin(const std::vector<Clause>& clauses) {
    if (clauses.size() != 1) {
        return false;
    }
    const auto& op = clauses.front().op;
    return (op == "==" || op == "===" || op == "=")
        && clauses.front().version.find('*') == std::string::npos;
}

// Highest lower bound the specifier guarantees, if any.
std::optional<std::string> LowerBoundOf(const std::vector<Clause>& clauses) {
    std::optional<std::string> floor;
    for (const auto& clause : clauses) {
        std::string bound;
        if (clause.op == ">=" || clause.op == ">" || clause.op == "~=") {
            bound = clause.version;
        } else if ((clause.op == "==" || clause.op == "=")
                   && clause.version.size() > 2
                   && clause.version.compare(clause.version.size() - 2, 2, ".*") == 0) {
            bound = clause.version.substr(0, clause.version.size() - 2);
        } else {
            continue;
        }
        if (!floor || CompareVersions(bound, *floor) > 0) {
            floor = bound;
        }
    }
    return floor;
}

}  // namespace

std::string NormalizePackageName(const std::string& name) {
    std::string normalized;
    normalized.reserve(name.size());
    bool in_separator = false;
    for (unsigned char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_separator) {
                normalized.push_back('-');
            }
            in_separator = true;
            continue;
        }
        in_separator = false;
        normalized.push_back(static_cast<char>(std::tolower(c)));
    }
    return normalized;
}

PackageRequirement ParseRequirement(const std::string& token) {
    PackageRequirement requirement;
    requirement.raw = token;

    std::size_t i = 0;
    while (i < token.size() && IsNameChar(static_cast<unsigned char>(token[i]))) {
        ++i;
    }
    requirement.name = NormalizePackageName(token.substr(0, i));

    auto rest = token.substr(i);
    if (!rest.empty() && rest[0] == '[') {
        const auto close = rest.find(']');
        rest = close == std::string::npos ? std::string() : rest.substr(close + 1);
    }
    const auto marker = rest.find(';');
    if (marker != std::string::npos) {
        rest.erase(marker);
    }
    for (unsigned char c : rest) {
        if (!std::isspace(c)) {
            requirement.specifier.push_back(static_cast<char>(c));
        }
    }
    return requirement;
}

std::optional<std::string> RequirementSyntaxError(const std::string& dependency) {
    static const std::regex kRequirement(
        R"(^[A-Za-z0-9](?:[A-Za-z0-9._-]*[A-Za-z0-9])?)"
        R"((?:\[[A-Za-z0-9._-]+(?:,[A-Za-z0-9._-]+)*\])?)"
        R"((?:(?:===|==|~=|>=|<=|!=|>|<|=)[A-Za-z0-9._*+!-]+)"
        R"((?:,(?:===|==|~=|>=|<=|!=|>|<|=)[A-Za-z0-9._*+!-]+)*)?$)");

    if (std::regex_match(dependency, kRequirement)) {
        return std::nullopt;
    }
    std::string printable;
    for (unsigned char c : dependency) {
        printable.push_back(std::isprint(c) ? static_cast<char>(c) : '?');
    }
    return "Invalid dependency: " + printable;
}

std::vector<std::string> ExtractInstallTargets(const std::string& text) {
    static const std::regex kInstallLine(
        R"(^\s*[!%]?\s*(?:python3?\s+-m\s+)?(pip3?|conda)\s+install\b(.*)$)",
        std::regex::ECMAScript | std::regex::icase);

    std::vector<std::string> targets;
    for (auto line : utils::SplitLines(text)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch match;
        if (!std::regex_match(line, match, kInstallLine)) {
            continue;
        }
        auto args = match[2].str();
        const auto comment = args.find('#');
        if (comment != std::string::npos) {
            args.erase(comment);
        }
        for (auto token : utils::SplitWhitespace(args)) {
            if (token[0] == '-') {
                continue;
            }
            while (!token.empty() && (token.front() == '"' || token.front() == '\'')) {
                token.erase(0, 1);
            }
            while (!token.empty() && (token.back() == '"' || token.back() == '\'')) {
                token.pop_back();
            }
            if (!token.empty()) {
                targets.push_back(token);
            }
        }
    }
    return targets;
}

int CompareVersions(const std::string& lhs, const std::string& rhs) {
    const auto left = ParseVersion(lhs);
    const auto right = ParseVersion(rhs);
    const auto count = std::max(left.release.size(), right.release.size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto a = i < left.release.size() ? left.release[i] : 0;
        const auto b = i < right.release.size() ? right.release[i] : 0;
        if (a != b) {
            return a < b ? -1 : 1;
        }
    }
    if (left.prerelease != right.prerelease) {
        return left.prerelease ? -1 : 1;
    }
    return 0;
}

PackagePolicy PackagePolicy::Default() {
    PackagePolicy policy;
    for (const char* name : kDefaultDenylist) {
        policy.Deny(name);
    }
    for (const auto& [name, version] : kDefaultMinimumVersions) {
        policy.SetMinimumVersion(name, version);
    }
    return policy;
}

void PackagePolicy::Deny(const std::string& name) {
    denylist_.insert(NormalizePackageName(name));
}

void PackagePolicy::Allow(const std::string& name) {
    allowlist_.insert(NormalizePackageName(name));
}

void PackagePolicy::SetMinimumVersion(const std::string& name, const std::string& version) {
    minimum_versions_[NormalizePackageName(name)] = version;
}

std::vector<std::string> PackagePolicy::Check(const PackageRequirement& requirement) const {
    std::vector<std::string> reasons;
    const auto& name = requirement.name;
    if (denylist_.count(name) > 0) {
        reasons.push_back("Package not allowed: " + name);
        return reasons;
    }
    if (!allowlist_.empty() && allowlist_.count(name) == 0) {
        reasons.push_back("Package not in allowlist: " + name);
        return reasons;
    }

    const auto minimum = minimum_versions_.find(name);
    if (minimum == minimum_versions_.end() || requirement.specifier.empty()) {
        return reasons;
    }
    const auto clauses = ParseClauses(requirement.specifier);
    if (IsExactPin(clauses)) {
        const auto& version = clauses.front().version;
        if (CompareVersions(version, minimum->second) < 0) {
            reasons.push_back("Package " + name + " version " + version
                              + " is below minimum required version " + minimum->second);
        }
        return reasons;
    }
    const auto floor = LowerBoundOf(clauses);
    if (!floor || CompareVersions(*floor, minimum->second) < 0) {
        reasons.push_back("Package " + name + " version range " + requirement.specifier
                          + " may allow versions below minimum required version " + minimum->second);
    }
    return reasons;
}

std::vector<std::string> PackagePolicy::CheckAll(const std::vector<std::string>& tokens) const {
    std::vector<std::string> reasons;
    for (const auto& token : tokens) {
        const auto requirement = ParseRequirement(token);
        if (requirement.name.empty()) {
            continue;
        }
        auto found = Check(requirement);
        reasons.insert(reasons.end(), found.begin(), found.end());
    }
    return reasons;
}

}  // namespace codebox::security
