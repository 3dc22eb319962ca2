#include "bindings.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codebox {
using namespace std;
using namespace nlohmann;

static void ensure_name(const string &name) {
    if (!binding_store::is_valid_name(name))
        throw validation_error(constraint::INVALID_BINDING, fmt::format("Invalid variable name '{}'", name));
}

void binding_store::set_module(const string &name, json value) {
    ensure_name(name);
    module[name] = move(value);
}

void binding_store::set_local(const string &name, json value) {
    ensure_name(name);
    local[name] = move(value);
}

const json &binding_store::module_bindings() const {
    return module;
}

const json &binding_store::local_bindings() const {
    return local;
}

json binding_store::merged() const {
    json result = module;
    for (auto &[name, value] : local.items())
        result[name] = value;
    return result;
}

bool binding_store::empty() const {
    return module.empty() && local.empty();
}

binding_store binding_store::from_json(const json &globals, const json &locals) {
    binding_store store;
    if (!globals.is_null()) {
        if (!globals.is_object())
            throw validation_error(constraint::INVALID_BINDING, "globals must be an object");
        for (auto &[name, value] : globals.items())
            store.set_module(name, value);
    }
    if (!locals.is_null()) {
        if (!locals.is_object())
            throw validation_error(constraint::INVALID_BINDING, "locals must be an object");
        for (auto &[name, value] : locals.items())
            store.set_local(name, value);
    }
    return store;
}

bool binding_store::is_valid_name(const string &name) {
    if (name.empty()) return false;
    if (name.find('\0') != string::npos) return false;
    if (name.rfind("__", 0) == 0) return false;
    return utf8_check_is_valid(name);
}

json binding_store::filter_captured(const json &snapshot) {
    json result = json::object();
    if (!snapshot.is_object()) return result;
    for (auto &[name, value] : snapshot.items()) {
        if (name.rfind("__", 0) == 0) continue;
        result[name] = value;
    }
    return result;
}

}  // namespace codebox
