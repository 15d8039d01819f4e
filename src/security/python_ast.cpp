#include "security/python_ast.hpp"

#include <pybind11/embed.h>

#include "utils/logging.hpp"

namespace py = pybind11;

namespace codebox::security {
namespace {

// Lives until exit. The GIL is handed back right after start so that any
// request thread can take it for the length of one parse.
class EmbeddedInterpreter {
public:
    EmbeddedInterpreter() {
        py::initialize_interpreter(false);
        saved_ = PyEval_SaveThread();
        utils::LogDebug("validator", "embedded python interpreter started");
    }

    ~EmbeddedInterpreter() {
        PyEval_RestoreThread(saved_);
        py::finalize_interpreter();
    }

    EmbeddedInterpreter(const EmbeddedInterpreter&) = delete;
    EmbeddedInterpreter& operator=(const EmbeddedInterpreter&) = delete;

private:
    PyThreadState* saved_ = nullptr;
};

void EnsureInterpreter() {
    static EmbeddedInterpreter interpreter;
}

std::string Describe(py::error_already_set& ex) {
    if (ex.matches(PyExc_SyntaxError)) {
        const py::object value = ex.value();
        std::string message = py::str(value.attr("msg"));
        const py::object line = value.attr("lineno");
        if (!line.is_none()) {
            message += " (line " + std::to_string(line.cast<int>()) + ")";
        }
        return message;
    }
    const std::string type = py::str(ex.type().attr("__name__"));
    const std::string value = py::str(ex.value());
    return type + ": " + value;
}

}  // namespace

std::string ImportSite::RootModule() const {
    return module.substr(0, module.find('.'));
}

PythonTree ParsePython(const std::string& source) {
    EnsureInterpreter();
    py::gil_scoped_acquire gil;

    try {
        const py::module_ ast = py::module_::import("ast");
        // The kernel receives the cell as UTF-8 text, so a coding cookie has no say.
        const py::object text = py::bytes(source).attr("decode")("utf-8");
        const py::object tree = ast.attr("parse")(text, "<cell>", "exec");

        const py::object call_type = ast.attr("Call");
        const py::object name_type = ast.attr("Name");
        const py::object import_type = ast.attr("Import");
        const py::object import_from_type = ast.attr("ImportFrom");

        PythonTree result;
        for (const py::handle node : ast.attr("walk")(tree)) {
            if (py::isinstance(node, call_type)) {
                const py::object func = node.attr("func");
                if (py::isinstance(func, name_type)) {
                    result.name_calls.push_back(
                        CallSite{func.attr("id").cast<std::string>(), node.attr("lineno").cast<int>()});
                }
            } else if (py::isinstance(node, import_type)) {
                const int line = node.attr("lineno").cast<int>();
                for (const py::handle alias : node.attr("names")) {
                    result.imports.push_back(ImportSite{alias.attr("name").cast<std::string>(), line});
                }
            } else if (py::isinstance(node, import_from_type)) {
                const py::object module = node.attr("module");
                if (!module.is_none()) {
                    result.imports.push_back(
                        ImportSite{module.cast<std::string>(), node.attr("lineno").cast<int>()});
                }
            }
        }
        return result;
    } catch (py::error_already_set& ex) {
        throw PythonSyntaxError(Describe(ex));
    }
}

}  // namespace codebox::security
