#include "security/code_validator.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::security {
namespace {

std::vector<ValidationRule> DefaultRules() {
    return {
        {"jupyter_commands", "Validate Jupyter magic and shell commands", true, RuleKind::kJupyterCommands},
        {"dangerous_builtins", "Prevent use of dangerous built-in functions", true, RuleKind::kDangerousBuiltins},
        {"dangerous_imports", "Prevent importing of dangerous modules", true, RuleKind::kDangerousImports},
        {"dangerous_patterns", "Prevent dangerous code patterns", true, RuleKind::kDangerousPatterns},
        {"package_installation", "Restrict installed packages and their versions", true,
         RuleKind::kPackageInstallation},
    };
}

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool IsShellOrMagic(const std::string& line) {
    const auto trimmed = utils::Trim(line);
    return utils::StartsWith(trimmed, "!") || utils::StartsWith(trimmed, "%");
}

// Shell and magic lines become "pass" at their own indent, so a block whose
// only statement is "!cmd" still parses and line numbers are unchanged.
std::string PlainLines(const std::string& code) {
    auto lines = utils::SplitLines(code);
    for (auto& line : lines) {
        if (IsShellOrMagic(line)) {
            line = line.substr(0, line.find_first_not_of(" \t")) + "pass";
        }
    }
    return utils::Join(lines, "\n");
}

}  // namespace

CodeValidator::CodeValidator()
    : CodeValidator(PackagePolicy::Default()) {}

CodeValidator::CodeValidator(PackagePolicy policy, const std::vector<std::string>& disabled_rules)
    : policy_(std::move(policy))
    , rules_(DefaultRules()) {
    for (const auto& name : disabled_rules) {
        SetEnabled(name, false);
    }
}

CodeValidator CodeValidator::WithDisabledRules(const std::vector<std::string>& names) {
    return CodeValidator(PackagePolicy::Default(), names);
}

CodeValidator CodeValidator::FromConfig(const config::ValidationConfig& config) {
    auto policy = PackagePolicy::Default();
    for (const auto& name : config.extra_denied_packages) {
        policy.Deny(name);
    }
    for (const auto& name : config.allowed_packages) {
        policy.Allow(name);
    }
    for (const auto& [name, version] : config.minimum_versions) {
        policy.SetMinimumVersion(name, version);
    }
    return CodeValidator(std::move(policy), config.disabled_rules);
}

ValidationResult CodeValidator::Validate(const std::string& code,
                                         const std::vector<std::string>& disabled_rules) const {
    if (Contains(disabled_rules, kAllRules)) {
        return ValidationResult{true, "Code validation passed"};
    }

    const auto rules = Rules();
    const auto plain = PlainLines(code);
    const RuleInput input{code, plain, policy_};

    std::vector<std::string> failures;
    for (const auto& rule : rules) {
        if (!rule.enabled || Contains(disabled_rules, rule.name)) {
            continue;
        }
        const auto outcome = CheckFor(rule.kind)(input);
        if (!outcome.passed) {
            failures.push_back(outcome.reason);
        }
    }

    if (!failures.empty()) {
        const auto message = utils::Join(failures, "; ");
        utils::LogInfo("validator", "rejected submission: " + message);
        return ValidationResult{false, message};
    }
    return ValidationResult{true, "Code validation passed"};
}

ValidationResult CodeValidator::ValidatePackages(const std::vector<std::string>& dependencies) const {
    // Dependencies end up on a shell line, so their shape is checked even when
    // the package rule is off.
    for (const auto& dependency : dependencies) {
        if (auto error = RequirementSyntaxError(dependency)) {
            utils::LogInfo("validator", "rejected dependencies: " + *error);
            return ValidationResult{false, *error};
        }
    }

    bool enabled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& rule : rules_) {
            if (rule.kind == RuleKind::kPackageInstallation) {
                enabled = rule.enabled;
            }
        }
    }
    if (!enabled) {
        return ValidationResult{true, "Code validation passed"};
    }
    const auto reasons = policy_.CheckAll(dependencies);
    if (!reasons.empty()) {
        const auto message = utils::Join(reasons, "; ");
        utils::LogInfo("validator", "rejected dependencies: " + message);
        return ValidationResult{false, message};
    }
    return ValidationResult{true, "Code validation passed"};
}

void CodeValidator::EnableRule(const std::string& name) {
    SetEnabled(name, true);
}

void CodeValidator::DisableRule(const std::string& name) {
    SetEnabled(name, false);
}

std::vector<ValidationRule> CodeValidator::Rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_;
}

void CodeValidator::SetEnabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name == kAllRules) {
        for (auto& rule : rules_) {
            rule.enabled = enabled;
        }
        return;
    }
    for (auto& rule : rules_) {
        if (rule.name == name) {
            rule.enabled = enabled;
            return;
        }
    }
    utils::LogWarn("validator", "unknown rule '" + name + "' ignored");
}

}  // namespace codebox::security
