#pragma once

#include <string>
#include <utility>

#include "security/package_policy.hpp"

namespace codebox::security {

// Evaluated in declaration order.
enum class RuleKind {
    kJupyterCommands,
    kDangerousBuiltins,
    kDangerousImports,
    kDangerousPatterns,
    kPackageInstallation
};

inline constexpr const char* kAllRules = "all";

struct ValidationRule {
    std::string name;
    std::string description;
    bool enabled = true;
    RuleKind kind = RuleKind::kJupyterCommands;
};

struct RuleOutcome {
    bool passed = true;
    std::string reason;

    static RuleOutcome Pass() { return RuleOutcome{}; }
    static RuleOutcome Fail(std::string reason) { return RuleOutcome{false, std::move(reason)}; }
};

// full_text is the submission as written; plain_text has every shell and magic
// line replaced by "pass" at its indent so that line numbers still match.
struct RuleInput {
    const std::string& full_text;
    const std::string& plain_text;
    const PackagePolicy& policy;
};

using RuleCheck = RuleOutcome (*)(const RuleInput& input);

RuleCheck CheckFor(RuleKind kind);

}  // namespace codebox::security
