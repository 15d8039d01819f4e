#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace codebox::security {

class PythonSyntaxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CallSite {
    std::string name;
    int line = 0;
};

struct ImportSite {
    std::string module;
    int line = 0;

    std::string RootModule() const;
};

// What the rules need from a parsed submission, in ast.walk order.
struct PythonTree {
    // Calls whose callee is a bare name: `eval(x)` and `(eval)(x)`, not `obj.eval(x)`.
    std::vector<CallSite> name_calls;
    // `import a.b` and `from a.b import c`; relative imports report the module
    // without its leading dots and are skipped when no module is named.
    std::vector<ImportSite> imports;
};

// Parses with CPython's ast module in an interpreter embedded on first use.
// Throws PythonSyntaxError when the source does not compile.
PythonTree ParsePython(const std::string& source);

}  // namespace codebox::security
