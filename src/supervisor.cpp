#include "supervisor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>
#include "cgroup.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "memory_sampler.hpp"
#include "output.hpp"
#include "process_tree.hpp"

namespace codebox {
using namespace std;

namespace {

struct pipe_reader {
    scoped_fd *fd;
    stream_buffer *buf;
};

/**
 * @brief 将请求写入 worker
 * 请求可能超过管道缓冲区的容量，因此与读取输出交替进行，避免双方互相等待
 */
struct request_writer {
    scoped_fd &fd;
    string payload;
    size_t offset = 0;

    bool pending() const {
        return (bool)fd;
    }

    void write_some() {
        while (offset < payload.size()) {
            ssize_t n = write(fd.get(), payload.data() + offset, payload.size() - offset);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return;
                if (errno == EPIPE) {
                    // worker 在读完请求之前就退出了，由退出状态决定结果
                    LOG(WARNING) << "worker closed request pipe after " << offset << " bytes";
                    break;
                }
                throw system_error(errno, system_category(), "writing request to worker");
            }
            offset += n;
        }
        fd.close();
    }
};

/**
 * @brief 等待管道可读写并处理
 * @param timeout 最长等待时间（单位为毫秒）
 */
void pump_pipes(vector<pipe_reader> &readers, request_writer &writer, int timeout) {
    vector<pollfd> fds;
    vector<pipe_reader *> owners;
    for (auto &reader : readers) {
        if (!*reader.fd) continue;
        fds.push_back({reader.fd->get(), POLLIN, 0});
        owners.push_back(&reader);
    }
    if (writer.pending()) fds.push_back({writer.fd.get(), POLLOUT, 0});

    if (fds.empty()) {
        this_thread::sleep_for(chrono::milliseconds(timeout));
        return;
    }

    int ret = poll(fds.data(), fds.size(), timeout);
    if (ret < 0) {
        if (errno == EINTR) return;
        throw system_error(errno, system_category(), "poll on worker pipes");
    }
    if (ret == 0) return;

    for (size_t i = 0; i < owners.size(); ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
            // EOF：关闭管道，之后不再 poll
            if (!output_capturer::drain(owners[i]->fd->get(), *owners[i]->buf))
                owners[i]->fd->close();
        }
    }
    if (writer.pending() && fds.back().revents & (POLLOUT | POLLHUP | POLLERR)) {
        writer.write_some();
    }
}

bool any_open(const vector<pipe_reader> &readers) {
    return any_of(readers.begin(), readers.end(), [](const pipe_reader &reader) { return (bool)*reader.fd; });
}

int wait_millis(chrono::steady_clock::duration remaining, chrono::milliseconds interval) {
    auto wait = chrono::ceil<chrono::milliseconds>(remaining);
    return (int)clamp(wait, chrono::milliseconds(0), interval).count();
}

}  // namespace

run_record supervise(const supervisor_options &opt, const message::worker_request &request) {
    run_record record;
    resource_monitor monitor(opt.time_limit, opt.memory_limit_bytes);

    // cgroup 必须比 worker 后析构：析构时杀死残留进程并删除 cgroup
    optional<run_cgroup> cg;
    if (opt.use_cgroup)
        cg.emplace(fmt::format("codebox/run_{}", opt.run_id), opt.worker.address_space_bytes);

    elapsed_time timer;
    worker_process worker(opt.worker);

    // worker 在读到完整的请求之前不会执行用户代码，因此在写入请求前移入 cgroup
    if (cg) cg->attach(worker.pid());

    // 即使使用 cgroup，也要追踪进程树，保证 worker 被回收之前杀死所有派生进程
    process_tree tree(worker.pid());
    unique_ptr<memory_sampler> sampler;
    if (cg) sampler = make_unique<cgroup_sampler>(*cg);
    else sampler = make_unique<process_tree_sampler>(tree);

    set_nonblocking(worker.stdout_fd.get());
    set_nonblocking(worker.stderr_fd.get());
    set_nonblocking(worker.report_fd.get());
    set_nonblocking(worker.request_fd.get());

    output_capturer capture(opt.output_limit);
    stream_buffer report(opt.report_limit);
    vector<pipe_reader> readers = {
        {&worker.stdout_fd, &capture.out},
        {&worker.stderr_fd, &capture.err},
        {&worker.report_fd, &report}};
    request_writer writer{worker.request_fd, nlohmann::dump_safe(nlohmann::json(request))};
    writer.write_some();

    while (true) {
        auto remaining = opt.time_limit - timer.duration<chrono::steady_clock::duration>();
        pump_pipes(readers, writer, wait_millis(remaining, opt.poll_interval));

        if (worker.exited()) break;

        resource_sample sample{timer.duration<chrono::steady_clock::duration>(), sampler->sample()};
        if (monitor.observe(sample) != run_state::RUNNING) {
            LOG(WARNING) << "run " << opt.run_id << " " << get_state_name(monitor.state()) << ": aborting worker " << worker.pid();
            break;
        }
    }
    record.elapsed_seconds = timer.seconds();

    // worker 尚未被回收，它的 pid 以及进程组和会话不会被复用。
    // 先杀死所有派生进程再回收 worker，它们可能仍持有管道的写端
    size_t killed = tree.kill_all();
    if (cg) cg->kill_tasks();
    worker_exit exit = worker.reap();
    reap_adopted_orphans();
    if (killed > 0) DLOG(INFO) << "run " << opt.run_id << ": sent SIGKILL " << killed << " times to worker processes";
    if (writer.pending()) writer.fd.close();

    auto deadline = chrono::steady_clock::now() + KILL_DELAY;
    while (any_open(readers)) {
        auto left = deadline - chrono::steady_clock::now();
        if (left <= chrono::steady_clock::duration::zero()) {
            LOG(WARNING) << "run " << opt.run_id << ": pipes still open after worker exit, giving up";
            break;
        }
        pump_pipes(readers, writer, wait_millis(left, KILL_DELAY));
    }

    monitor.record_peak(exit.max_rss_bytes());
    if (cg) {
        try {
            monitor.record_peak(cg->max_memory_usage());
        } catch (const cgroup_exception &e) {
            LOG(WARNING) << "unable to read peak memory of cgroup " << cg->name() << ": " << e.what();
        }
    }

    if (!report.truncated()) record.report = message::parse_worker_report(report.str());

    if (monitor.state() == run_state::RUNNING) {
        bool abnormal = !exit.normal() || !record.report;
        if (exit.signaled() && exit.term_signal() == SIGXCPU) {
            monitor.limit_enforced(run_state::TIMED_OUT);
        } else if (abnormal && cg && cg->oom_killed()) {
            monitor.limit_enforced(run_state::MEMORY_EXCEEDED);
        } else {
            monitor.worker_exited(abnormal);
        }
    }
    monitor.terminate();

    record.outcome = monitor.outcome();
    record.stdout_text = capture.out.str();
    record.stderr_text = capture.err.str();
    record.stdout_truncated = capture.out.truncated();
    record.stderr_truncated = capture.err.truncated();
    record.exit_description = exit.describe();
    record.peak_memory_bytes = monitor.peak_memory();

    LOG(INFO) << fmt::format("run {}: worker {} {}, {} after {:.3f}s, peak memory {}KB, {} samples",
                             opt.run_id, worker.pid(), record.exit_description, get_state_name(record.outcome),
                             record.elapsed_seconds, record.peak_memory_bytes / 1024, monitor.samples());
    return record;
}

}  // namespace codebox
