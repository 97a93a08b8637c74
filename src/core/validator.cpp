/*
 * codegate - Code Safety Validator Implementation
 *
 * Equivalent Python:
 *
 *   for node in ast.walk(ast.parse(code, "<generated>", "exec")):
 *       if isinstance(node, ast.Import):       check each alias.name
 *       elif isinstance(node, ast.ImportFrom): check node.module (may be None)
 */
#include <codegate/core/python_runtime.hpp>
#include <codegate/core/validator.hpp>
#include <codegate/core/utils.hpp>

namespace codegate {

const char* const CodeValidator::REASON_UNPARSEABLE = "unparseable";
const char* const CodeValidator::REASON_PARSER_UNAVAILABLE = "parser unavailable";
const char* const CodeValidator::REASON_ANALYSIS_FAILED = "analysis failed";

ValidationOutcome CodeValidator::reject(const std::string& reason, const std::string& module) {
    ValidationOutcome outcome;
    outcome.safe = false;
    outcome.reason = reason;
    outcome.module = module;
    return outcome;
}

ValidationOutcome CodeValidator::validate(const std::string& code, const Policy& policy) const {
    // ast.parse("") succeeds, but there is nothing worth running
    if (trim(code).empty()) {
        return reject(REASON_UNPARSEABLE);
    }

    if (!PythonRuntime::instance().ensure_initialized()) {
        return reject(REASON_PARSER_UNAVAILABLE);
    }

    GilGuard gil;

    PyRef ast_module(PyImport_ImportModule("ast"));
    if (!ast_module) {
        PyErr_Clear();
        return reject(REASON_PARSER_UNAVAILABLE);
    }

    PyRef parse_fn(PyObject_GetAttrString(ast_module.get(), "parse"));
    PyRef walk_fn(PyObject_GetAttrString(ast_module.get(), "walk"));
    PyRef import_type(PyObject_GetAttrString(ast_module.get(), "Import"));
    PyRef import_from_type(PyObject_GetAttrString(ast_module.get(), "ImportFrom"));
    if (!parse_fn || !walk_fn || !import_type || !import_from_type) {
        PyErr_Clear();
        return reject(REASON_PARSER_UNAVAILABLE);
    }

    // Decode with the exact byte length: an embedded NUL must reach the
    // parser (and fail there) instead of silently cutting the source short.
    PyRef source(PyUnicode_DecodeUTF8(code.data(), static_cast<Py_ssize_t>(code.size()), "strict"));
    if (!source) {
        PyErr_Clear();
        return reject(REASON_UNPARSEABLE);
    }

    PyRef filename(PyUnicode_FromString("<generated>"));
    PyRef mode(PyUnicode_FromString("exec"));
    if (!filename || !mode) {
        PyErr_Clear();
        return reject(REASON_ANALYSIS_FAILED);
    }

    PyRef tree(PyObject_CallFunctionObjArgs(parse_fn.get(), source.get(),
                                            filename.get(), mode.get(), NULL));
    if (!tree) {
        // SyntaxError, ValueError (null bytes), RecursionError, MemoryError...
        ValidationOutcome outcome = reject(REASON_UNPARSEABLE);
        outcome.detail = fetch_python_error();
        return outcome;
    }

    PyRef walker(PyObject_CallFunctionObjArgs(walk_fn.get(), tree.get(), NULL));
    PyRef nodes(walker ? PyObject_GetIter(walker.get()) : nullptr);
    if (!nodes) {
        PyErr_Clear();
        return reject(REASON_ANALYSIS_FAILED);
    }

    while (true) {
        PyRef node(PyIter_Next(nodes.get()));
        if (!node) {
            if (PyErr_Occurred()) {
                PyErr_Clear();
                return reject(REASON_ANALYSIS_FAILED);
            }
            break;
        }

        int is_import = PyObject_IsInstance(node.get(), import_type.get());
        int is_import_from = is_import == 1 ? 0 : PyObject_IsInstance(node.get(), import_from_type.get());
        if (is_import < 0 || is_import_from < 0) {
            PyErr_Clear();
            return reject(REASON_ANALYSIS_FAILED);
        }

        if (is_import == 1) {
            // import a.b, c as d
            PyRef names(PyObject_GetAttrString(node.get(), "names"));
            PyRef seq(names ? PySequence_Fast(names.get(), "names") : nullptr);
            if (!seq) {
                PyErr_Clear();
                return reject(REASON_ANALYSIS_FAILED);
            }

            Py_ssize_t count = PySequence_Fast_GET_SIZE(seq.get());
            for (Py_ssize_t i = 0; i < count; ++i) {
                PyObject* alias = PySequence_Fast_GET_ITEM(seq.get(), i); // borrowed
                PyRef name_obj(PyObject_GetAttrString(alias, "name"));
                std::string name;
                if (!name_obj || !python_string(name_obj.get(), &name)) {
                    PyErr_Clear();
                    return reject(REASON_ANALYSIS_FAILED);
                }
                if (policy.is_denied(name)) {
                    return reject("denied import: " + name, name);
                }
            }
        } else if (is_import_from == 1) {
            // from a.b import c / from . import c (module is None)
            PyRef module_obj(PyObject_GetAttrString(node.get(), "module"));
            if (!module_obj) {
                PyErr_Clear();
                return reject(REASON_ANALYSIS_FAILED);
            }
            if (module_obj.get() == Py_None) {
                continue;
            }

            std::string module;
            if (!python_string(module_obj.get(), &module)) {
                return reject(REASON_ANALYSIS_FAILED);
            }
            if (policy.is_denied(module)) {
                return reject("denied import: " + module, module);
            }
        }
    }

    ValidationOutcome outcome;
    outcome.safe = true;
    outcome.code = ValidatedCode(code);
    return outcome;
}

} // namespace codegate
