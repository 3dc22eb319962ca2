#include "result.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "bindings.hpp"

namespace codebox {
using namespace std;

static string describe_snippet_error(const message::worker_report &report) {
    if (!report.traceback.empty()) return report.traceback;
    if (report.message.empty()) return report.exception_type;
    return fmt::format("{}: {}", report.exception_type, report.message);
}

static void fail(execution_result &result, error_kind kind, string message) {
    result.success = false;
    result.error = kind;
    result.error_message = move(message);
}

execution_result assemble_result(const execution_request &request, const run_record &record) {
    execution_result result;
    result.stdout_data = record.stdout_text;
    result.stderr_data = record.stderr_text;
    result.execution_time = max(record.elapsed_seconds, 0.0);
    result.memory_used_mb = max(record.peak_memory_bytes, (int64_t)0) / (1024.0 * 1024.0);
    if (record.stdout_truncated) result.output_truncated.push_back("stdout");
    if (record.stderr_truncated) result.output_truncated.push_back("stderr");

    switch (record.outcome) {
        case run_state::TIMED_OUT:
            fail(result, error_kind::TIMEOUT,
                 fmt::format("Code execution timeout after {} seconds", request.timeout_seconds));
            return result;
        case run_state::MEMORY_EXCEEDED:
            fail(result, error_kind::MEMORY_LIMIT_EXCEEDED,
                 fmt::format("Code execution exceeded memory limit of {} MB", request.max_memory_mb));
            return result;
        case run_state::COMPLETED:
            if (record.report) break;
            [[fallthrough]];
        default:
            if (record.exit_description.empty())
                fail(result, error_kind::WORKER_CRASHED, "Worker process crashed");
            else
                fail(result, error_kind::WORKER_CRASHED,
                     fmt::format("Worker process {}{}", record.exit_description,
                                 record.report ? "" : " without reporting a result"));
            return result;
    }

    const message::worker_report &report = *record.report;
    if (report.ok) {
        result.success = true;
    } else {
        if (!report.exception_type.empty()) result.exception_type = report.exception_type;

        if (report.kind == "syntax") {
            fail(result, error_kind::SNIPPET_SYNTAX_ERROR, describe_snippet_error(report));
        } else if (report.kind == "memory") {
            // 解释器在 RLIMIT_AS 下分配失败，此时解释器的状态不可信，不返回变量快照
            fail(result, error_kind::MEMORY_LIMIT_EXCEEDED,
                 fmt::format("Code execution exceeded memory limit of {} MB", request.max_memory_mb));
            return result;
        } else {
            fail(result, error_kind::SNIPPET_RUNTIME_ERROR, describe_snippet_error(report));
        }
    }

    if (request.capture_bindings && report.bindings)
        result.captured_bindings = binding_store::filter_captured(*report.bindings);

    return result;
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {
        {"success", result.success},
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"error_type", nullptr},
        {"error_message", nullptr},
        {"execution_time", result.execution_time},
        {"memory_used_mb", result.memory_used_mb},
        {"locals_dict", nullptr},
        {"exception_type", nullptr},
        {"output_truncated", result.output_truncated}};

    if (result.error) j["error_type"] = get_display_message(*result.error);
    if (result.error_message) j["error_message"] = *result.error_message;
    if (result.captured_bindings) j["locals_dict"] = *result.captured_bindings;
    if (result.exception_type) j["exception_type"] = *result.exception_type;
}

}  // namespace codebox
