#include "interpreter.hpp"
#include <fmt/core.h>
#include "conversion.hpp"

namespace codebox::python {
using namespace std;

namespace {

/**
 * @brief 用户代码抛出的异常
 */
struct snippet_exception {
    py_ref type, value, traceback;

    /**
     * @brief 取出并清除当前的 Python 异常
     */
    static snippet_exception fetch() {
        PyObject *type, *value, *tb;
        PyErr_Fetch(&type, &value, &tb);
        PyErr_NormalizeException(&type, &value, &tb);
        if (tb && value) PyException_SetTraceback(value, tb);
        return {py_ref(type), py_ref(value), py_ref(tb)};
    }

    bool matches(PyObject *exc) const {
        return type && PyErr_GivenExceptionMatches(type.get(), exc);
    }

    string type_name() const {
        if (!type) return "Exception";
        return ((PyTypeObject *)type.get())->tp_name;
    }

    string message() const {
        if (!value) return "";
        py_ref str(PyObject_Str(value.get()));
        if (str) {
            Py_ssize_t size;
            const char *text = PyUnicode_AsUTF8AndSize(str.get(), &size);
            if (text) return string(text, size);
        }
        PyErr_Clear();
        return safe_repr(value.get());
    }

    /**
     * @brief 通过 traceback 模块格式化完整的 traceback
     * 内存不足时格式化本身也可能失败，此时只返回异常类名和信息
     */
    string format() const {
        py_ref module(PyImport_ImportModule("traceback"));
        py_ref lines(module ? PyObject_CallMethod(module.get(), "format_exception", "OOO",
                                                  type.get(), value ? value.get() : Py_None,
                                                  traceback ? traceback.get() : Py_None)
                            : nullptr);
        py_ref empty(lines ? PyUnicode_FromString("") : nullptr);
        py_ref joined(empty ? PyUnicode_Join(empty.get(), lines.get()) : nullptr);
        if (joined) {
            Py_ssize_t size;
            const char *text = PyUnicode_AsUTF8AndSize(joined.get(), &size);
            if (text) return string(text, size);
        }
        PyErr_Clear();
        string msg = message();
        return msg.empty() ? type_name() + "\n" : fmt::format("{}: {}\n", type_name(), msg);
    }
};

/**
 * @brief 判断 SystemExit 是否表示正常结束
 */
bool is_clean_exit(const snippet_exception &ex) {
    if (!ex.value) return true;
    py_ref code(PyObject_GetAttrString(ex.value.get(), "code"));
    if (!code) {
        PyErr_Clear();
        return false;
    }
    if (code.get() == Py_None) return true;
    if (PyLong_Check(code.get())) {
        long value = PyLong_AsLong(code.get());
        if (value == -1 && PyErr_Occurred()) PyErr_Clear();
        return value == 0;
    }
    return false;
}

/**
 * @brief 像解释器一样将 traceback 写入 sys.stderr
 * 用户代码可能替换或关闭了 sys.stderr，写入失败时忽略
 */
void write_stderr(const string &text) {
    PyObject *err = PySys_GetObject("stderr");  // 借用的引用
    if (!err || err == Py_None) return;
    py_ref str(PyUnicode_DecodeUTF8(text.data(), text.size(), "replace"));
    py_ref ret(str ? PyObject_CallMethod(err, "write", "O", str.get()) : nullptr);
    py_ref flushed(ret ? PyObject_CallMethod(err, "flush", nullptr) : nullptr);
    if (!flushed) PyErr_Clear();
}

void fail(message::worker_report &report, const string &kind, const snippet_exception &ex) {
    report.ok = false;
    report.kind = kind;
    report.exception_type = ex.type_name();
    report.message = ex.message();
    report.traceback = ex.format();
    write_stderr(report.traceback);
}

}  // namespace

message::worker_report run_snippet(const message::worker_request &request) {
    message::worker_report report;

    py_ref ns = ensure(PyDict_New(), "PyDict_New");
    py_ref builtins = ensure(PyImport_ImportModule("builtins"), "import builtins");
    if (PyDict_SetItemString(ns.get(), "__builtins__", builtins.get()) != 0)
        throw python_error("unable to set __builtins__: " + fetch_error_string());
    py_ref name = ensure(PyUnicode_FromString("__main__"), "PyUnicode_FromString");
    if (PyDict_SetItemString(ns.get(), "__name__", name.get()) != 0)
        throw python_error("unable to set __name__: " + fetch_error_string());

    if (request.bindings.is_object()) {
        for (auto it = request.bindings.begin(); it != request.bindings.end(); ++it) {
            py_ref value = from_json(it.value());
            if (PyDict_SetItemString(ns.get(), it.key().c_str(), value.get()) != 0)
                throw python_error(fmt::format("unable to bind '{}': {}", it.key(), fetch_error_string()));
        }
    }

    // Py_CompileString 以 NUL 作为代码的结尾，含有 NUL 的代码会被悄悄截断
    py_ref code;
    if (request.code.find('\0') != string::npos)
        PyErr_SetString(PyExc_SyntaxError, "source code string cannot contain null bytes");
    else
        code = py_ref(Py_CompileString(request.code.c_str(), "<snippet>", Py_file_input));

    if (!code) {
        snippet_exception ex = snippet_exception::fetch();
        if (ex.matches(PyExc_SyntaxError)) fail(report, "syntax", ex);
        else if (ex.matches(PyExc_MemoryError)) fail(report, "memory", ex);
        else fail(report, "runtime", ex);
    } else {
        py_ref result(PyEval_EvalCode(code.get(), ns.get(), ns.get()));
        if (result) {
            report.ok = true;
        } else {
            snippet_exception ex = snippet_exception::fetch();
            if (ex.matches(PyExc_SystemExit) && is_clean_exit(ex)) {
                report.ok = true;
            } else if (ex.matches(PyExc_MemoryError)) {
                fail(report, "memory", ex);
            } else {
                fail(report, "runtime", ex);
            }
        }
    }

    if (request.capture) report.bindings = snapshot(ns.get());
    return report;
}

}  // namespace codebox::python
