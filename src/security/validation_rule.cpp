#include "security/validation_rule.hpp"

#include <regex>
#include <set>

#include "security/python_ast.hpp"
#include "utils/common.hpp"

namespace codebox::security {
namespace {

const std::set<std::string> kAllowedShellCommands = {
    "pip", "conda", "jupyter", "python",
    "pytest", "black", "flake8", "mypy",
    "curl", "wget",
};

const std::set<std::string> kForbiddenBuiltins = {
    "eval", "exec", "globals", "locals", "compile", "__import__",
};

const std::set<std::string> kForbiddenModules = {
    "os", "sys", "subprocess", "multiprocessing", "socket",
    "pickle", "marshal", "shelve", "pty", "pdb",
};

RuleOutcome SyntaxFailure(const PythonSyntaxError& ex) {
    return RuleOutcome::Fail(std::string("Invalid Python syntax: ") + ex.what());
}

RuleOutcome CheckJupyterCommands(const RuleInput& input) {
    for (const auto& line : utils::SplitLines(input.full_text)) {
        const auto trimmed = utils::Trim(line);
        if (!utils::StartsWith(trimmed, "!")) {
            continue;
        }
        const auto words = utils::SplitWhitespace(trimmed.substr(1));
        if (words.empty()) {
            return RuleOutcome::Fail("Empty shell command");
        }
        if (kAllowedShellCommands.count(words.front()) == 0) {
            return RuleOutcome::Fail("Shell command not allowed: " + words.front());
        }
    }
    return RuleOutcome::Pass();
}

RuleOutcome CheckBuiltins(const RuleInput& input) {
    try {
        const auto tree = ParsePython(input.plain_text);
        for (const auto& call : tree.name_calls) {
            if (kForbiddenBuiltins.count(call.name) > 0) {
                return RuleOutcome::Fail("Forbidden function call: " + call.name);
            }
        }
    } catch (const PythonSyntaxError& ex) {
        return SyntaxFailure(ex);
    }
    return RuleOutcome::Pass();
}

RuleOutcome CheckImports(const RuleInput& input) {
    try {
        const auto tree = ParsePython(input.plain_text);
        for (const auto& site : tree.imports) {
            if (kForbiddenModules.count(site.RootModule()) > 0) {
                return RuleOutcome::Fail("Forbidden import: " + site.module);
            }
        }
    } catch (const PythonSyntaxError& ex) {
        return SyntaxFailure(ex);
    }
    return RuleOutcome::Pass();
}

// A dunder name such as __class__ unless the underscores directly follow '!' or '%'.
RuleOutcome CheckPatterns(const RuleInput& input) {
    static const std::regex kDunder(R"(__\w+__)");
    const auto& text = input.plain_text;
    for (auto pos = text.find("__"); pos != std::string::npos; pos = text.find("__", pos + 1)) {
        if (pos > 0 && (text[pos - 1] == '!' || text[pos - 1] == '%')) {
            continue;
        }
        std::smatch match;
        if (std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(pos), text.end(), match, kDunder,
                              std::regex_constants::match_continuous)) {
            return RuleOutcome::Fail("Forbidden pattern found: " + match.str());
        }
    }
    return RuleOutcome::Pass();
}

RuleOutcome CheckPackageInstallation(const RuleInput& input) {
    const auto reasons = input.policy.CheckAll(ExtractInstallTargets(input.full_text));
    if (reasons.empty()) {
        return RuleOutcome::Pass();
    }
    return RuleOutcome::Fail(utils::Join(reasons, "; "));
}

// Indexed by RuleKind.
const RuleCheck kDispatch[] = {
    &CheckJupyterCommands,
    &CheckBuiltins,
    &CheckImports,
    &CheckPatterns,
    &CheckPackageInstallation,
};

}  // namespace

RuleCheck CheckFor(RuleKind kind) {
    return kDispatch[static_cast<int>(kind)];
}

}  // namespace codebox::security
