#include <codegate/core/python_runtime.hpp>
#include <codegate/core/logger.hpp>

namespace codegate {

PythonRuntime& PythonRuntime::instance() {
    static PythonRuntime runtime;
    return runtime;
}

PythonRuntime::PythonRuntime()
    : initialized_(false)
    , owns_interpreter_(false)
    , saved_state_(nullptr)
{}

bool PythonRuntime::ensure_initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return true;
    }

    if (Py_IsInitialized()) {
        // Embedded into a host that already runs Python
        initialized_ = true;
        owns_interpreter_ = false;
        LOG_DEBUG("[Python] Reusing host interpreter");
        return true;
    }

    // 0: leave SIGINT and friends to the application
    Py_InitializeEx(0);
    if (!Py_IsInitialized()) {
        LOG_ERROR("[Python] Interpreter failed to initialize");
        return false;
    }

    initialized_ = true;
    owns_interpreter_ = true;
    LOG_INFO("[Python] Embedded interpreter %s ready for parsing", Py_GetVersion());

    // Drop the lock so any thread can take it with PyGILState_Ensure
    saved_state_ = PyEval_SaveThread();
    return true;
}

void PythonRuntime::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_ || !owns_interpreter_) {
        return;
    }

    PyEval_RestoreThread(saved_state_);
    saved_state_ = nullptr;
    if (Py_FinalizeEx() < 0) {
        LOG_WARN("[Python] Interpreter finalization reported errors");
    }
    initialized_ = false;
    owns_interpreter_ = false;
    LOG_DEBUG("[Python] Interpreter finalized");
}

std::string fetch_python_error() {
    if (!PyErr_Occurred()) {
        return "";
    }

    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);

    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    std::string name = "Exception";
    if (type && PyType_Check(type)) {
        name = reinterpret_cast<PyTypeObject*>(type)->tp_name;
    }

    std::string message;
    if (value) {
        PyRef text(PyObject_Str(value));
        if (!text || !python_string(text.get(), &message)) {
            PyErr_Clear();
        }
    }

    return message.empty() ? name : name + ": " + message;
}

bool python_string(PyObject* obj, std::string* out) {
    if (!obj || !PyUnicode_Check(obj)) {
        return false;
    }
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(obj, &size);
    if (!data) {
        PyErr_Clear();
        return false;
    }
    out->assign(data, static_cast<size_t>(size));
    return true;
}

} // namespace codegate
