#include "conversion.hpp"
#include <cmath>

namespace codebox::python {
using namespace std;
using namespace nlohmann;

py_ref from_json(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
            return py_ref::borrow(Py_None);
        case json::value_t::boolean:
            return ensure(PyBool_FromLong(value.get<bool>()), "PyBool_FromLong");
        case json::value_t::number_integer:
            return ensure(PyLong_FromLongLong(value.get<long long>()), "PyLong_FromLongLong");
        case json::value_t::number_unsigned:
            return ensure(PyLong_FromUnsignedLongLong(value.get<unsigned long long>()), "PyLong_FromUnsignedLongLong");
        case json::value_t::number_float:
            return ensure(PyFloat_FromDouble(value.get<double>()), "PyFloat_FromDouble");
        case json::value_t::string: {
            const string &str = value.get_ref<const string &>();
            return ensure(PyUnicode_FromStringAndSize(str.data(), str.size()), "PyUnicode_FromStringAndSize");
        }
        case json::value_t::array: {
            py_ref list = ensure(PyList_New(value.size()), "PyList_New");
            Py_ssize_t i = 0;
            for (auto &item : value) {
                // PyList_SET_ITEM 接管引用
                PyList_SET_ITEM(list.get(), i++, from_json(item).release());
            }
            return list;
        }
        case json::value_t::object: {
            py_ref dict = ensure(PyDict_New(), "PyDict_New");
            for (auto it = value.begin(); it != value.end(); ++it) {
                py_ref obj = from_json(it.value());
                py_ref key = ensure(PyUnicode_FromStringAndSize(it.key().data(), it.key().size()), "PyUnicode_FromStringAndSize");
                if (PyDict_SetItem(dict.get(), key.get(), obj.get()) != 0)
                    throw python_error("PyDict_SetItemString: " + fetch_error_string());
            }
            return dict;
        }
        case json::value_t::binary: {
            auto &bytes = value.get_binary();
            return ensure(PyBytes_FromStringAndSize((const char *)bytes.data(), bytes.size()), "PyBytes_FromStringAndSize");
        }
        default:
            return py_ref::borrow(Py_None);
    }
}

static json sequence_to_json(PyObject *obj, int depth) {
    py_ref seq(PySequence_Fast(obj, "expected a sequence"));
    if (!seq) {
        PyErr_Clear();
        return safe_repr(obj);
    }
    json result = json::array();
    Py_ssize_t size = PySequence_Fast_GET_SIZE(seq.get());
    PyObject **items = PySequence_Fast_ITEMS(seq.get());
    for (Py_ssize_t i = 0; i < size; ++i)
        result.push_back(to_json(items[i], depth + 1));
    return result;
}

/**
 * @brief 取出 dict 的所有键值对
 * repr 可能执行用户代码并修改 dict，因此不能在 PyDict_Next 的过程中转换
 */
static py_ref dict_items(PyObject *dict) {
    py_ref items(PyDict_Items(dict));
    if (!items) PyErr_Clear();
    return items;
}

static json dict_to_json(PyObject *obj, int depth) {
    json result = json::object();
    py_ref items = dict_items(obj);
    if (!items) return safe_repr(obj);
    for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); ++i) {
        PyObject *pair = PyList_GET_ITEM(items.get(), i);
        PyObject *key = PyTuple_GET_ITEM(pair, 0);
        PyObject *value = PyTuple_GET_ITEM(pair, 1);
        string name;
        if (PyUnicode_Check(key)) {
            Py_ssize_t size;
            const char *text = PyUnicode_AsUTF8AndSize(key, &size);
            if (text) {
                name.assign(text, size);
            } else {
                PyErr_Clear();
                name = safe_repr(key);
            }
        } else {
            py_ref str(PyObject_Str(key));
            const char *text = str ? PyUnicode_AsUTF8(str.get()) : nullptr;
            if (text) {
                name = text;
            } else {
                PyErr_Clear();
                name = safe_repr(key);
            }
        }
        result[name] = to_json(value, depth + 1);
    }
    return result;
}

json to_json(PyObject *obj, int depth) {
    if (depth > MAX_DEPTH) return safe_repr(obj);

    if (obj == Py_None) return nullptr;

    // bool 是 int 的子类，必须先判断
    if (PyBool_Check(obj)) return obj == Py_True;

    if (PyLong_Check(obj)) {
        int overflow = 0;
        long long value = PyLong_AsLongLongAndOverflow(obj, &overflow);
        if (overflow != 0 || (value == -1 && PyErr_Occurred())) {
            PyErr_Clear();
            return safe_repr(obj);
        }
        return value;
    }

    if (PyFloat_Check(obj)) {
        double value = PyFloat_AsDouble(obj);
        if (!isfinite(value)) return safe_repr(obj);
        return value;
    }

    if (PyUnicode_Check(obj)) {
        Py_ssize_t size;
        const char *text = PyUnicode_AsUTF8AndSize(obj, &size);
        if (!text) {
            // 含有代理字符的字符串无法编码为 UTF-8
            PyErr_Clear();
            return safe_repr(obj);
        }
        return string(text, size);
    }

    if (PyList_Check(obj) || PyTuple_Check(obj)) return sequence_to_json(obj, depth);

    if (PyDict_Check(obj)) return dict_to_json(obj, depth);

    return safe_repr(obj);
}

bool is_capturable(const string &name, PyObject *value) {
    if (name.compare(0, 2, "__") == 0) return false;
    if (PyModule_Check(value) || PyType_Check(value)) return false;
    if (PyCallable_Check(value)) return false;
    return true;
}

json snapshot(PyObject *dict) {
    json result = json::object();
    py_ref items = dict_items(dict);
    if (!items) return result;
    for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); ++i) {
        PyObject *pair = PyList_GET_ITEM(items.get(), i);
        PyObject *key = PyTuple_GET_ITEM(pair, 0);
        PyObject *value = PyTuple_GET_ITEM(pair, 1);
        if (!PyUnicode_Check(key)) continue;
        const char *text = PyUnicode_AsUTF8(key);
        if (!text) {
            PyErr_Clear();
            continue;
        }
        string name = text;
        if (!is_capturable(name, value)) continue;
        result[name] = to_json(value);
    }
    return result;
}

}  // namespace codebox::python
