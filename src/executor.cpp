#include "executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "supervisor.hpp"
#include "worker.hpp"

namespace codebox {
using namespace std;

static string new_run_id() {
    // random_generator 不是线程安全的，每个线程使用自己的生成器
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

executor::executor(size_t concurrency) : gate_(concurrency) {
    // worker 提前退出时，向请求管道写入会触发 SIGPIPE，我们需要的是 EPIPE
    signal(SIGPIPE, SIG_IGN);
    // worker 被杀死后，它收养的孤儿进程转而由引擎收养，而不是 init
    become_subreaper();
}

void executor::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void executor::call_monitor(const string &run_id, const function<void(monitor &)> &callback) {
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Run " << run_id << " has crashed when reporting monitoring information, " << ex.what();
        }
    }
}

execution_result executor::execute(const nlohmann::json &body) {
    raw_request raw;
    try {
        raw = parse_raw_request(body);
    } catch (validation_error &ex) {
        call_monitor("-", [&](monitor &m) { m.report_error(fmt::format("rejected request: {}", ex.what())); });
        throw;
    }
    return execute(raw);
}

execution_result executor::execute(const raw_request &raw) {
    execution_request request;
    try {
        request = validate_request(raw);
    } catch (validation_error &ex) {
        call_monitor("-", [&](monitor &m) { m.report_error(fmt::format("rejected request: {}", ex.what())); });
        throw;
    }
    return run(request);
}

execution_result executor::run(const execution_request &request) {
    admission_permit permit = gate_.acquire();
    string run_id = new_run_id();

    try {
        filesystem::path work_dir = RUN_DIR / run_id;
        filesystem::create_directories(work_dir);
        defer {
            if (DEBUG) return;
            error_code ec;
            filesystem::remove_all(work_dir, ec);
            if (ec) LOG(WARNING) << "unable to remove work directory " << work_dir << ": " << ec.message();
        };

        supervisor_options opt;
        opt.run_id = run_id;
        opt.worker.executable = WORKER_PATH;
        opt.worker.work_dir = work_dir;
        opt.worker.timeout_seconds = request.timeout_seconds;
        opt.worker.address_space_bytes = (int64_t)(request.max_memory_mb + ADDRESS_SPACE_HEADROOM_MB) << 20;
        opt.worker.file_limit = FILE_LIMIT;
        opt.worker.nproc_limit = NPROC_LIMIT;
        opt.time_limit = chrono::seconds(request.timeout_seconds);
        opt.memory_limit_bytes = (int64_t)request.max_memory_mb << 20;
        opt.poll_interval = chrono::milliseconds(POLL_INTERVAL_MS);
        opt.output_limit = OUTPUT_LIMIT;
        opt.report_limit = REPORT_LIMIT;
        opt.use_cgroup = USE_CGROUP;

        call_monitor(run_id, [&](monitor &m) { m.start_execution(run_id, request); });

        run_record record = supervise(opt, request.to_worker_request());
        execution_result result = assemble_result(request, record);

        call_monitor(run_id, [&](monitor &m) { m.end_execution(run_id, request, result); });
        return result;
    } catch (internal_error &ex) {
        LOG(ERROR) << "run " << run_id << " failed: " << ex;
        call_monitor(run_id, [&](monitor &m) { m.report_error(ex.what()); });
        throw;
    } catch (std::exception &ex) {
        LOG(ERROR) << "run " << run_id << " failed: " << boost::diagnostic_information(ex);
        call_monitor(run_id, [&](monitor &m) { m.report_error(ex.what()); });
        throw internal_error(fmt::format("run {} failed: {}", run_id, ex.what()));
    }
}

nlohmann::json executor::limits() const {
    return {
        {"min_timeout_seconds", MIN_TIMEOUT_SECONDS},
        {"max_timeout_seconds", MAX_TIMEOUT_SECONDS},
        {"default_timeout_seconds", DEFAULT_TIMEOUT_SECONDS},
        {"min_memory_mb", MIN_MEMORY_MB},
        {"max_memory_mb", MAX_MEMORY_MB},
        {"default_memory_mb", DEFAULT_MEMORY_MB},
        {"max_code_length", MAX_CODE_LENGTH}};
}

nlohmann::json executor::health() const {
    bool available = !WORKER_PATH.empty() && access(WORKER_PATH.c_str(), X_OK) == 0;
    bool saturated = gate_.saturated();

    string status = "healthy";
    if (!available) status = "degraded";
    else if (saturated) status = "saturated";

    return {
        {"status", status},
        {"executor_available", available},
        {"running", gate_.in_use()},
        {"capacity", gate_.capacity()},
        {"default_timeout", DEFAULT_TIMEOUT_SECONDS},
        {"default_memory_limit_mb", DEFAULT_MEMORY_MB}};
}

const admission_gate &executor::gate() const {
    return gate_;
}

}  // namespace codebox
