#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace codebox::security {

struct PackageRequirement {
    std::string raw;
    std::string name;
    std::string specifier;
};

// Lower-cases and folds runs of '-', '_' and '.' into a single '-'.
std::string NormalizePackageName(const std::string& name);

// Splits "Pillow[extra]>=9.0,<11" into name "pillow" and specifier ">=9.0,<11".
PackageRequirement ParseRequirement(const std::string& token);

// Reason a session dependency is not one plain requirement such as
// "pandas[excel]>=2,<3"; nullopt when it is. Whitespace, quotes, shell
// metacharacters, markers and URLs are all refused.
std::optional<std::string> RequirementSyntaxError(const std::string& dependency);

// Package tokens of every `pip install` / `conda install` line in the text,
// with flags, comments and surrounding quotes removed.
std::vector<std::string> ExtractInstallTargets(const std::string& text);

// Numeric release comparison padded with zeros; a pre-release sorts before
// the release it precedes. Returns <0, 0 or >0.
int CompareVersions(const std::string& lhs, const std::string& rhs);

class PackagePolicy {
public:
    static PackagePolicy Default();

    void Deny(const std::string& name);
    void Allow(const std::string& name);
    void SetMinimumVersion(const std::string& name, const std::string& version);

    // Reasons the requirement is refused; empty when it may be installed.
    std::vector<std::string> Check(const PackageRequirement& requirement) const;
    std::vector<std::string> CheckAll(const std::vector<std::string>& tokens) const;

    const std::set<std::string>& Denylist() const { return denylist_; }
    const std::set<std::string>& Allowlist() const { return allowlist_; }
    const std::map<std::string, std::string>& MinimumVersions() const { return minimum_versions_; }

private:
    std::set<std::string> denylist_;
    std::set<std::string> allowlist_;
    std::map<std::string, std::string> minimum_versions_;
};

}  // namespace codebox::security
