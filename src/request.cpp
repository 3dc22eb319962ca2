#include "request.hpp"
#include <fmt/core.h>
#include <limits>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;
using namespace nlohmann;

message::worker_request execution_request::to_worker_request() const {
    message::worker_request request;
    request.code = code;
    request.bindings = input_bindings.merged();
    request.capture = capture_bindings;
    return request;
}

execution_request validate_request(const raw_request &raw) {
    if (raw.code.empty())
        throw validation_error(constraint::CODE_EMPTY, "Code cannot be empty or whitespace only");
    if (!utf8_check_is_valid(raw.code))
        throw validation_error(constraint::CODE_NOT_UTF8, "Code must be valid UTF-8");
    if (utf8_is_blank(raw.code))
        throw validation_error(constraint::CODE_EMPTY, "Code cannot be empty or whitespace only");
    size_t length = utf8_length(raw.code);
    if (length > MAX_CODE_LENGTH)
        throw validation_error(constraint::CODE_TOO_LONG,
                               fmt::format("Code length {} exceeds the maximum of {} characters", length, MAX_CODE_LENGTH));

    long long timeout = raw.timeout.value_or(DEFAULT_TIMEOUT_SECONDS);
    if (timeout < MIN_TIMEOUT_SECONDS || timeout > MAX_TIMEOUT_SECONDS)
        throw validation_error(constraint::TIMEOUT_OUT_OF_RANGE,
                               fmt::format("Timeout must be between {} and {} seconds, got {}", MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS, timeout));

    long long memory = raw.max_memory_mb.value_or(DEFAULT_MEMORY_MB);
    if (memory < MIN_MEMORY_MB || memory > MAX_MEMORY_MB)
        throw validation_error(constraint::MEMORY_OUT_OF_RANGE,
                               fmt::format("Memory limit must be between {} and {} MB, got {}", MIN_MEMORY_MB, MAX_MEMORY_MB, memory));

    execution_request request;
    request.code = raw.code;
    request.timeout_seconds = (int)timeout;
    request.max_memory_mb = (int)memory;
    request.input_bindings = binding_store::from_json(raw.globals, raw.locals);

    // 过大的变量会让 worker 收到被截断的请求，在这里提前拒绝
    size_t bindings_size = dump_safe(request.input_bindings.merged()).size();
    if (bindings_size > MAX_BINDINGS_SIZE)
        throw validation_error(constraint::BINDINGS_TOO_LARGE,
                               fmt::format("Serialized bindings of {} bytes exceed the maximum of {} bytes", bindings_size, MAX_BINDINGS_SIZE));
    request.capture_bindings = raw.capture_locals;
    return request;
}

template <typename T>
static void read_field(const json &body, const char *name, T &value) {
    if (!body.count(name) || body.at(name).is_null()) return;
    try {
        value = body.at(name).get<T>();
    } catch (json::type_error &) {
        throw validation_error(constraint::INVALID_FIELD, fmt::format("Field '{}' has an unexpected type", name));
    }
}

template <typename T>
static void read_integer(const json &body, const char *name, optional<T> &value) {
    if (!body.count(name) || body.at(name).is_null()) return;
    const json &field = body.at(name);
    // 拒绝 30.5 这样的小数与字符串，只接受整数
    if (!field.is_number_integer())
        throw validation_error(constraint::INVALID_FIELD, fmt::format("Field '{}' must be an integer", name));
    if (field.is_number_unsigned() && field.get<unsigned long long>() > (unsigned long long)numeric_limits<T>::max())
        value = numeric_limits<T>::max();
    else
        value = field.get<T>();
}

raw_request parse_raw_request(const json &body) {
    if (!body.is_object())
        throw validation_error(constraint::INVALID_FIELD, "Request body must be an object");

    raw_request raw;
    if (!body.count("code") || body.at("code").is_null())
        throw validation_error(constraint::CODE_EMPTY, "Field 'code' is required");
    read_field(body, "code", raw.code);
    read_integer(body, "timeout", raw.timeout);
    read_integer(body, "max_memory_mb", raw.max_memory_mb);
    if (body.count("globals")) raw.globals = body.at("globals");
    if (body.count("locals")) raw.locals = body.at("locals");
    read_field(body, "capture_locals", raw.capture_locals);
    return raw;
}

}  // namespace codebox
