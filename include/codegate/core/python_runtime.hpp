/*
 * codegate - Embedded Python Runtime
 *
 * The validator parses candidate code with the interpreter's own `ast`
 * module, so the grammar it checks is exactly the grammar the sandboxed
 * child will run. The interpreter is embedded once per process and used
 * only for parsing; candidate code is never executed in-process.
 *
 * Threads that touch Python objects must hold a GilGuard.
 */
#ifndef codegate_CORE_PYTHON_RUNTIME_HPP
#define codegate_CORE_PYTHON_RUNTIME_HPP

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <string>
#include <mutex>

namespace codegate {

// Owns one strong reference
class PyRef {
public:
    explicit PyRef(PyObject* obj = nullptr) : obj_(obj) {}
    ~PyRef() { Py_XDECREF(obj_); }

    PyRef(PyRef&& other) noexcept : obj_(other.obj_) { other.obj_ = nullptr; }
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(obj_);
            obj_ = other.obj_;
            other.obj_ = nullptr;
        }
        return *this;
    }

    PyObject* get() const { return obj_; }
    explicit operator bool() const { return obj_ != nullptr; }

private:
    PyRef(const PyRef&);
    PyRef& operator=(const PyRef&);

    PyObject* obj_;
};

// Holds the interpreter lock for the lifetime of the object
class GilGuard {
public:
    GilGuard() : state_(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(state_); }

private:
    GilGuard(const GilGuard&);
    GilGuard& operator=(const GilGuard&);

    PyGILState_STATE state_;
};

class PythonRuntime {
public:
    static PythonRuntime& instance();

    // Start the interpreter if nobody has yet. Safe to call from any thread.
    // Returns false if the interpreter could not be brought up.
    bool ensure_initialized();

    // Finalize the interpreter if this object started it
    void shutdown();

private:
    PythonRuntime();
    PythonRuntime(const PythonRuntime&);
    PythonRuntime& operator=(const PythonRuntime&);

    mutable std::mutex mutex_;
    bool initialized_;
    bool owns_interpreter_;
    PyThreadState* saved_state_;
};

// Take the pending Python exception (if any) as "TypeName: message"
// and clear it. Caller must hold the GIL.
std::string fetch_python_error();

// UTF-8 contents of a str object. Caller must hold the GIL.
bool python_string(PyObject* obj, std::string* out);

} // namespace codegate

#endif // codegate_CORE_PYTHON_RUNTIME_HPP
