#include "monitor/audit_log.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace codebox {
using namespace std;

void audit_log::start_execution(const string &run_id, const execution_request &request) {
    LOG(INFO) << fmt::format("[audit] run {} started: code length {}, timeout {}s, memory {}MB, {} bindings, capture {}",
                             run_id, request.code.size(), request.timeout_seconds, request.max_memory_mb,
                             request.input_bindings.merged().size(), request.capture_bindings);
}

void audit_log::end_execution(const string &run_id, const execution_request &, const execution_result &result) {
    string outcome = result.success ? "success" : get_display_message(*result.error);
    LOG(INFO) << fmt::format("[audit] run {} finished: {}, time {:.3f}s, memory {:.2f}MB, stdout {} bytes, stderr {} bytes",
                             run_id, outcome, result.execution_time, result.memory_used_mb,
                             result.stdout_data.size(), result.stderr_data.size());
}

void audit_log::report_error(const string &message) {
    LOG(ERROR) << "[audit] " << message;
}

}  // namespace codebox
