#include "resource_monitor.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace codebox {
using namespace std;

const char *get_state_name(run_state state) {
    switch (state) {
        case run_state::RUNNING: return "running";
        case run_state::COMPLETED: return "completed";
        case run_state::TIMED_OUT: return "timed-out";
        case run_state::MEMORY_EXCEEDED: return "memory-exceeded";
        case run_state::CRASHED: return "crashed";
        case run_state::TERMINATED: return "terminated";
    }
    return "unknown";
}

resource_monitor::resource_monitor(chrono::steady_clock::duration time_limit, int64_t memory_limit_bytes)
    : time_limit_(time_limit), memory_limit_(memory_limit_bytes) {}

run_state resource_monitor::observe(const resource_sample &sample) {
    peak = max(peak, sample.memory_bytes);
    if (state_ != run_state::RUNNING) return state_;

    size_t index = samples_++;
    if (!time_crossed_at && sample.elapsed >= time_limit_) time_crossed_at = index;
    if (!memory_crossed_at && sample.memory_bytes >= memory_limit_) memory_crossed_at = index;

    if (time_crossed_at && (!memory_crossed_at || *time_crossed_at < *memory_crossed_at)) {
        state_ = outcome_ = run_state::TIMED_OUT;
        LOG(WARNING) << "timelimit exceeded (hard wall time) at sample " << index;
    } else if (memory_crossed_at) {
        state_ = outcome_ = run_state::MEMORY_EXCEEDED;
        LOG(WARNING) << "memory limit exceeded at sample " << index << ": " << sample.memory_bytes / 1024 << "kB";
    }
    return state_;
}

run_state resource_monitor::worker_exited(bool abnormal) {
    if (state_ == run_state::RUNNING)
        state_ = outcome_ = abnormal ? run_state::CRASHED : run_state::COMPLETED;
    return state_;
}

run_state resource_monitor::limit_enforced(run_state reason) {
    if (state_ == run_state::RUNNING) {
        state_ = outcome_ = reason;
        LOG(WARNING) << "worker killed by kernel: " << get_state_name(reason);
    }
    return state_;
}

void resource_monitor::terminate() {
    if (state_ == run_state::RUNNING) outcome_ = run_state::CRASHED;
    state_ = run_state::TERMINATED;
}

bool resource_monitor::should_kill() const {
    return state_ == run_state::TIMED_OUT || state_ == run_state::MEMORY_EXCEEDED;
}

run_state resource_monitor::state() const {
    return state_;
}

run_state resource_monitor::outcome() const {
    return outcome_;
}

void resource_monitor::record_peak(int64_t memory_bytes) {
    peak = max(peak, memory_bytes);
}

int64_t resource_monitor::peak_memory() const {
    return peak;
}

size_t resource_monitor::samples() const {
    return samples_;
}

}  // namespace codebox
