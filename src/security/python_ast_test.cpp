#include "security/python_ast.hpp"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using codebox::security::ParsePython;
using codebox::security::PythonSyntaxError;

std::vector<std::string> CallNames(const std::string& code) {
    std::vector<std::string> names;
    for (const auto& call : ParsePython(code).name_calls) {
        names.push_back(call.name);
    }
    return names;
}

std::vector<std::string> ImportNames(const std::string& code) {
    std::vector<std::string> names;
    for (const auto& site : ParsePython(code).imports) {
        names.push_back(site.module);
    }
    return names;
}

std::string SyntaxMessage(const std::string& code) {
    try {
        ParsePython(code);
    } catch (const PythonSyntaxError& ex) {
        return ex.what();
    }
    return {};
}

// NOLINTNEXTLINE
TEST(PythonAst, NameCallsSkipAttributesAndDefinitions) {
    const auto names = CallNames("def eval(x):\n    return x\nobj.exec(1)\nprint(len([1]))\n");
    EXPECT_THAT(names, ElementsAre("print", "len"));
}

// NOLINTNEXTLINE
TEST(PythonAst, ParenthesizedCalleeIsStillAName) {
    EXPECT_THAT(CallNames("(eval)('1+1')\n"), ElementsAre("eval"));
    EXPECT_THAT(CallNames("((exec))(\"print(1)\")\n"), ElementsAre("exec"));
}

// NOLINTNEXTLINE
TEST(PythonAst, CallsInsideStringsAreNotCalls) {
    EXPECT_THAT(CallNames("s = 'eval(1)'\nt = \"\"\"exec(2)\"\"\"\n# compile(3)\n"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(PythonAst, FStringFieldsAreCalls) {
    EXPECT_THAT(CallNames("x = f'{eval(\"1\")!r:>10}'\n"), ElementsAre("eval"));
    EXPECT_THAT(CallNames("x = f'{{eval(1)}}'\n"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(PythonAst, ImportForms) {
    const auto names = ImportNames(
        "import os.path as p, json\n"
        "from collections import abc\n"
        "from .. import sibling\n"
        "from .pkg.mod import thing\n"
        "if True: from sys import argv\n");
    EXPECT_THAT(names, ElementsAre("os.path", "json", "collections", "pkg.mod", "sys"));
}

// NOLINTNEXTLINE
TEST(PythonAst, RootModule) {
    codebox::security::ImportSite site{"os.path", 1};
    EXPECT_EQ(site.RootModule(), "os");
}

// NOLINTNEXTLINE
TEST(PythonAst, CallsCarryTheirLine) {
    const auto tree = ParsePython("x = (1,\n     2)\ny = 1 + \\\n    2\nprint(y)\n");
    ASSERT_EQ(tree.name_calls.size(), 1u);
    EXPECT_EQ(tree.name_calls[0].line, 5);
}

// NOLINTNEXTLINE
TEST(PythonAst, SyntaxErrorsCarryLine) {
    EXPECT_THAT(SyntaxMessage("x = 1\nprint((1)\n"), HasSubstr("'(' was never closed (line 2)"));
    EXPECT_THAT(SyntaxMessage("x = (1 +)\n"), HasSubstr("(line 1)"));
    EXPECT_THAT(SyntaxMessage("x = 1)\n"), HasSubstr("unmatched ')'"));
    EXPECT_THAT(SyntaxMessage("s = 'abc\n"), HasSubstr("unterminated string literal"));
    EXPECT_FALSE(SyntaxMessage("x = 1 $ 2\n").empty());
    EXPECT_FALSE(SyntaxMessage("y = 9.0.0\n").empty());
}

// NOLINTNEXTLINE
TEST(PythonAst, InvalidUtf8IsRejected) {
    EXPECT_THAT(SyntaxMessage("x = '\xff'\n"), HasSubstr("UnicodeDecodeError"));
}

// NOLINTNEXTLINE
TEST(PythonAst, ValidNumbersParse) {
    EXPECT_EQ(SyntaxMessage("x = 1e-5 + 0x1F + 1_000.5\n"), "");
}

}  // namespace
