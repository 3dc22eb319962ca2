#include "python.hpp"
#include <fmt/core.h>

namespace codebox::python {
using namespace std;

py_ref::py_ref() : obj(nullptr) {}

py_ref::py_ref(PyObject *obj) : obj(obj) {}

py_ref::py_ref(py_ref &&other) noexcept : obj(other.obj) {
    other.obj = nullptr;
}

py_ref::~py_ref() {
    Py_XDECREF(obj);
}

py_ref &py_ref::operator=(py_ref &&other) noexcept {
    if (this != &other) {
        Py_XDECREF(obj);
        obj = other.obj;
        other.obj = nullptr;
    }
    return *this;
}

py_ref py_ref::borrow(PyObject *obj) {
    Py_XINCREF(obj);
    return py_ref(obj);
}

PyObject *py_ref::get() const {
    return obj;
}

PyObject *py_ref::release() {
    PyObject *result = obj;
    obj = nullptr;
    return result;
}

py_ref::operator bool() const {
    return obj != nullptr;
}

python_error::python_error(const string &message) : runtime_error(message) {}

py_ref ensure(PyObject *obj, const char *what) {
    if (!obj) throw python_error(fmt::format("{}: {}", what, fetch_error_string()));
    return py_ref(obj);
}

string fetch_error_string() {
    if (!PyErr_Occurred()) return "unknown error";

    PyObject *type, *value, *tb;
    PyErr_Fetch(&type, &value, &tb);
    PyErr_NormalizeException(&type, &value, &tb);
    py_ref type_ref(type), value_ref(value), tb_ref(tb);

    string name = type ? ((PyTypeObject *)type)->tp_name : "Exception";
    py_ref str(value ? PyObject_Str(value) : nullptr);
    if (str) {
        const char *text = PyUnicode_AsUTF8(str.get());
        if (text) return fmt::format("{}: {}", name, text);
    }
    PyErr_Clear();
    return name;
}

string safe_repr(PyObject *obj) {
    py_ref repr(PyObject_Repr(obj));
    if (repr) {
        Py_ssize_t size;
        const char *text = PyUnicode_AsUTF8AndSize(repr.get(), &size);
        if (text) return string(text, size);
    }
    PyErr_Clear();
    return fmt::format("<unrepresentable {} object>", Py_TYPE(obj)->tp_name);
}

interpreter::interpreter(const char *program_name) {
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);

    // 用户代码被强制终止前写出的内容必须已经到达管道
    config.buffered_stdio = 0;
    config.use_hash_seed = 1;
    config.hash_seed = 0;
    config.write_bytecode = 0;

    PyStatus status = PyConfig_SetBytesString(&config, &config.program_name, program_name);
    if (!PyStatus_Exception(status))
        status = PyConfig_SetString(&config, &config.stdio_encoding, L"utf-8");
    if (!PyStatus_Exception(status))
        status = PyConfig_SetString(&config, &config.stdio_errors, L"strict");
    if (!PyStatus_Exception(status))
        status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);

    if (PyStatus_Exception(status)) {
        throw python_error(fmt::format("unable to initialize Python: {}{}{}",
                                       status.func ? status.func : "",
                                       status.func ? ": " : "",
                                       status.err_msg ? status.err_msg : "unknown error"));
    }
}

interpreter::~interpreter() {
    finalize();
}

int interpreter::finalize() {
    if (finalized) return 0;
    finalized = true;
    return Py_FinalizeEx();
}

}  // namespace codebox::python
