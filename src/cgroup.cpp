#include "cgroup.hpp"

#include <glog/logging.h>
#include <fmt/core.h>
#include <libcgroup.h>
#include <signal.h>
#include <cstdlib>
#include <sstream>
#include "common/defer.hpp"

namespace codebox {
using namespace std;

cgroup_exception::cgroup_exception(const string &cgroup_op, int err) {
    if (err == ECGOTHER) {
        errmsg += "libcgroup: ";
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(cgroup_get_last_errno());
    } else {
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(err);
    }
}

const char *cgroup_exception::what() const noexcept {
    return errmsg.c_str();
}

void cgroup_exception::ensure(const string &cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    cgroup_exception::ensure(
        "cgroup_init",
        cgroup_init());
}

void cgroup_ctrl::add_value(const string &name, int64_t value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

int64_t cgroup_ctrl::get_value_int64(const string &name) {
    int64_t value;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

string cgroup_ctrl::get_value_string(const string &name) {
    char *value = nullptr;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_string({})", name),
        cgroup_get_value_string(ctrl, name.c_str(), &value));
    defer { free(value); };
    return value ? string(value) : string();
}

cgroup_guard::cgroup_guard(const string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_exception::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

cgroup_ctrl cgroup_guard::get_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::attach_task_pid(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

void cgroup_guard::delete_cgroup() {
    cgroup_exception::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

run_cgroup::run_cgroup(string name, int64_t memory_limit_bytes) : name_(move(name)) {
    cgroup_guard cg(name_);
    cgroup_ctrl ctrl = cg.add_controller("memory");

    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
    ctrl.add_value("memory.limit_in_bytes", memory_limit_bytes);
    ctrl.add_value("memory.memsw.limit_in_bytes", memory_limit_bytes);

    cg.create_cgroup(1);
    DLOG(INFO) << "cgroup " << name_ << " created with memory limit " << memory_limit_bytes;
}

run_cgroup::~run_cgroup() {
    try {
        kill_tasks();
        cgroup_guard cg(name_);
        cg.add_controller("memory");
        cg.delete_cgroup();
    } catch (const cgroup_exception &e) {
        LOG(ERROR) << "unable to delete cgroup " << name_ << ": " << e.what();
    }
}

void run_cgroup::attach(pid_t pid) {
    cgroup_guard cg(name_);
    cg.get_cgroup();
    cg.attach_task_pid(pid);
}

void run_cgroup::kill_tasks() {
    void *handle = nullptr;
    pid_t pid;

    int ret = cgroup_get_task_begin(name_.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        kill(pid, SIGKILL);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    if (ret != ECGEOF)
        throw cgroup_exception(fmt::format("cgroup_get_task({})", name_), ret);
}

int64_t run_cgroup::memory_usage() {
    cgroup_guard cg(name_);
    cg.get_cgroup();
    return cg.get_controller("memory").get_value_int64("memory.usage_in_bytes");
}

int64_t run_cgroup::max_memory_usage() {
    cgroup_guard cg(name_);
    cg.get_cgroup();
    return cg.get_controller("memory").get_value_int64("memory.max_usage_in_bytes");
}

bool run_cgroup::oom_killed() {
    cgroup_guard cg(name_);
    cg.get_cgroup();
    // memory.oom_control 的内容形如 "oom_kill_disable 0\nunder_oom 0\noom_kill 1"
    istringstream ss(cg.get_controller("memory").get_value_string("memory.oom_control"));
    string key;
    int64_t value;
    while (ss >> key >> value) {
        if ((key == "oom_kill" || key == "under_oom") && value > 0) return true;
    }
    return false;
}

const string &run_cgroup::name() const {
    return name_;
}

}  // namespace codebox
