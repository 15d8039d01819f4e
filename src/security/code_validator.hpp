#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "security/package_policy.hpp"
#include "security/validation_rule.hpp"

namespace codebox::security {

struct ValidationResult {
    bool ok = true;
    std::string message;
};

class CodeValidator {
public:
    CodeValidator();
    explicit CodeValidator(PackagePolicy policy, const std::vector<std::string>& disabled_rules = {});

    static CodeValidator WithDisabledRules(const std::vector<std::string>& names);
    // Default policy extended with the configured packages and rule switches.
    static CodeValidator FromConfig(const config::ValidationConfig& config);

    // Runs every enabled rule not named in disabled_rules; "all" accepts outright.
    ValidationResult Validate(const std::string& code,
                              const std::vector<std::string>& disabled_rules = {}) const;
    // Session dependencies go through the package_installation rule.
    ValidationResult ValidatePackages(const std::vector<std::string>& dependencies) const;

    void EnableRule(const std::string& name);
    void DisableRule(const std::string& name);

    std::vector<ValidationRule> Rules() const;
    const PackagePolicy& Policy() const { return policy_; }

private:
    void SetEnabled(const std::string& name, bool enabled);

    PackagePolicy policy_;
    std::vector<ValidationRule> rules_;
    mutable std::mutex mutex_;
};

}  // namespace codebox::security
