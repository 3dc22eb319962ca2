#include "worker.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <mutex>
#include <set>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"
#include "common/messages.hpp"
#include "process_tree.hpp"

namespace codebox {
using namespace std;

/**
 * @brief 子进程在 exec 之前失败的阶段
 */
enum spawn_stage {
    STAGE_DUP = 1,
    STAGE_SETSID,
    STAGE_SUBREAPER,
    STAGE_RLIMIT,
    STAGE_CHDIR,
    STAGE_SIGNAL,
    STAGE_EXEC
};

static const char *get_stage_name(int stage) {
    switch (stage) {
        case STAGE_DUP: return "redirecting file descriptors";
        case STAGE_SETSID: return "setsid";
        case STAGE_SUBREAPER: return "becoming child subreaper";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_CHDIR: return "changing to work directory";
        case STAGE_SIGNAL: return "restoring signal handlers";
        case STAGE_EXEC: return "execve";
        default: return "unknown stage";
    }
}

struct spawn_failure {
    int stage;
    int err;
};

struct rlimit_entry {
    int resource;
    struct rlimit limit;
};

/**
 * @brief 子进程出错时通知父进程并退出，只使用 async-signal-safe 的函数
 */
[[noreturn]] static void child_fail(int status_fd, int stage) {
    spawn_failure failure{stage, errno};
    ssize_t ret = write(status_fd, &failure, sizeof(failure));
    (void)ret;
    _exit(127);
}

/**
 * @brief 当前进程中所有尚未回收的 worker
 * fork 与登记在同一个锁中完成，清理孤儿进程时不会把刚启动的 worker 当成孤儿
 */
static mutex workers_mutex;
static set<pid_t> live_workers;

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(forward<Args>(args)...));
}

bool worker_exit::exited() const {
    return WIFEXITED(status);
}

int worker_exit::exit_code() const {
    return WEXITSTATUS(status);
}

bool worker_exit::signaled() const {
    return WIFSIGNALED(status);
}

int worker_exit::term_signal() const {
    return WTERMSIG(status);
}

bool worker_exit::normal() const {
    return exited() && exit_code() == message::E_SUCCESS;
}

int64_t worker_exit::max_rss_bytes() const {
    // Linux 中 ru_maxrss 的单位是 KB
    return (int64_t)usage.ru_maxrss * 1024;
}

string worker_exit::describe() const {
    if (signaled()) {
        int sig = term_signal();
        return fmt::format("terminated by signal {} ({})", sig, strsignal(sig));
    } else if (exited()) {
        return fmt::format("exited with code {}", exit_code());
    } else {
        return fmt::format("unknown status {}", status);
    }
}

worker_process::worker_process(const worker_options &opt) {
    // argv、envp 以及所有限制都必须在 fork 之前准备好
    string executable = opt.executable.string();
    string work_dir = opt.work_dir.string();
    vector<char *> argv = {executable.data(), nullptr};

    const char *path = getenv("PATH");
    vector<string> env = {
        fmt::format("PATH={}", path ? path : "/usr/local/bin:/usr/bin:/bin"),
        "PYTHONIOENCODING=utf-8"};
    vector<char *> envp;
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    vector<rlimit_entry> limits;
    limits.push_back({RLIMIT_CORE, {0, 0}});
    if (opt.timeout_seconds > 0) {
        // 到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL
        rlim_t cputime = (rlim_t)opt.timeout_seconds;
        limits.push_back({RLIMIT_CPU, {cputime + 1, cputime + 2}});
    }
    if (opt.address_space_bytes > 0)
        limits.push_back({RLIMIT_AS, {(rlim_t)opt.address_space_bytes, (rlim_t)opt.address_space_bytes}});
    if (opt.file_limit > 0)
        limits.push_back({RLIMIT_FSIZE, {(rlim_t)opt.file_limit, (rlim_t)opt.file_limit}});
    if (opt.nproc_limit > 0)
        limits.push_back({RLIMIT_NPROC, {(rlim_t)opt.nproc_limit, (rlim_t)opt.nproc_limit}});

    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;

    scoped_fd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull) error(errno, "opening /dev/null");

    scoped_fd child_stdout, child_stderr, child_request, child_report, status_read, status_write;
    make_pipe(stdout_fd, child_stdout);
    make_pipe(stderr_fd, child_stderr);
    make_pipe(child_request, request_fd);
    make_pipe(report_fd, child_report);
    make_pipe(status_read, status_write);

    // 子进程中的目标文件描述符：0 stdin, 1 stdout, 2 stderr, 3 request, 4 report
    int sources[] = {devnull.get(), child_stdout.get(), child_stderr.get(), child_request.get(), child_report.get()};
    const int targets = sizeof(sources) / sizeof(sources[0]);
    int status_fd = status_write.get();

    unique_lock<mutex> registry(workers_mutex);
    pid_t pid = fork();
    if (pid < 0) {
        throw internal_error(fmt::format("unable to fork worker: {}", strerror(errno)));
    }

    if (pid == 0) {
        // 先将所有管道复制到高位，避免 dup2 时覆盖了尚未复制的文件描述符
        int high[targets];
        for (int i = 0; i < targets; ++i) {
            high[i] = fcntl(sources[i], F_DUPFD_CLOEXEC, 10);
            if (high[i] < 0) child_fail(status_fd, STAGE_DUP);
        }
        for (int i = 0; i < targets; ++i) {
            if (dup2(high[i], i) < 0) child_fail(status_fd, STAGE_DUP);
        }
        // 关闭从父进程继承的、没有设置 close-on-exec 的文件描述符
        for (int fd = targets; fd < max_fd; ++fd) {
            if (fd != status_fd) close(fd);
        }

        // 在新的会话中运行，这样 worker 和它派生的所有进程都可以通过一个信号杀死
        if (setsid() == -1) child_fail(status_fd, STAGE_SETSID);

        // 用户代码派生的进程成为孤儿后由 worker 收养，始终留在 worker 的进程树中
        if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) child_fail(status_fd, STAGE_SUBREAPER);

        for (auto &entry : limits) {
            if (setrlimit(entry.resource, &entry.limit) != 0) child_fail(status_fd, STAGE_RLIMIT);
        }

        if (chdir(work_dir.c_str()) != 0) child_fail(status_fd, STAGE_CHDIR);

        // 父进程忽略了 SIGPIPE，被忽略的信号会跨越 exec 继承
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_DFL;
        sigset_t emptymask;
        if (sigemptyset(&emptymask) != 0) child_fail(status_fd, STAGE_SIGNAL);
        sigact.sa_mask = emptymask;
        if (sigaction(SIGPIPE, &sigact, nullptr) != 0) child_fail(status_fd, STAGE_SIGNAL);
        if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) child_fail(status_fd, STAGE_SIGNAL);

        execve(argv[0], argv.data(), envp.data());
        child_fail(status_fd, STAGE_EXEC);
    }

    pid_ = pid;
    live_workers.insert(pid);
    registry.unlock();

    // 关闭父进程中属于子进程的管道端，这样子进程退出后父进程能读到 EOF
    child_stdout.close();
    child_stderr.close();
    child_request.close();
    child_report.close();
    status_write.close();

    spawn_failure failure;
    ssize_t nread;
    do {
        nread = read(status_read.get(), &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);

    if (nread != 0) {
        reap();
        if (nread == (ssize_t)sizeof(failure)) {
            throw internal_error(fmt::format("unable to start worker {}: {}: {}",
                                             executable, get_stage_name(failure.stage), strerror(failure.err)));
        } else {
            throw internal_error(fmt::format("unable to start worker {}: broken status pipe", executable));
        }
    }

    DLOG(INFO) << "worker " << pid_ << " started in " << work_dir;
}

worker_process::~worker_process() {
    if (pid_ < 0 || reaped_) return;
    try {
        kill_group();
        reap();
    } catch (const system_error &e) {
        LOG(ERROR) << "unable to clean up worker " << pid_ << ": " << e.what();
    }
}

pid_t worker_process::pid() const {
    return pid_;
}

void worker_process::kill_group() {
    // worker 调用了 setsid，因此它的 pid 就是进程组号
    if (kill(-pid_, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to worker group {}", pid_);
    if (!reaped_ && kill(pid_, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to worker {}", pid_);
}

bool worker_process::exited() {
    if (reaped_) return true;

    siginfo_t info;
    memset(&info, 0, sizeof(info));
    int ret;
    do {
        ret = waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) error(errno, "waiting for worker {}", pid_);
    return info.si_pid == pid_;
}

worker_exit worker_process::reap() {
    if (reaped_) throw internal_error(fmt::format("worker {} has already been reaped", pid_));

    worker_exit result;
    pid_t ret;
    do {
        ret = wait4(pid_, &result.status, 0, &result.usage);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) error(errno, "waiting for worker {}", pid_);

    reaped_ = true;
    lock_guard<mutex> registry(workers_mutex);
    live_workers.erase(pid_);
    return result;
}

void become_subreaper() {
    if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0)
        error(errno, "becoming child subreaper");
}

size_t reap_adopted_orphans() {
    lock_guard<mutex> registry(workers_mutex);
    pid_t self = getpid();

    vector<pid_t> orphans;
    for (auto &p : scan_processes()) {
        if (p.ppid != self || live_workers.count(p.pid)) continue;
        if (kill(p.pid, SIGKILL) != 0 && errno != ESRCH)
            error(errno, "sending SIGKILL to orphan {}", p.pid);
        orphans.push_back(p.pid);
    }

    // 在锁中回收，回收之前 pid 不会被新启动的 worker 复用
    for (pid_t pid : orphans) {
        pid_t ret;
        do {
            ret = waitpid(pid, nullptr, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret < 0 && errno != ECHILD) error(errno, "waiting for orphan {}", pid);
    }

    if (!orphans.empty()) LOG(WARNING) << "reaped " << orphans.size() << " orphaned processes left by workers";
    return orphans.size();
}

}  // namespace codebox
