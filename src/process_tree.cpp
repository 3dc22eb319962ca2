#include "process_tree.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>
#include "common/utils.hpp"

namespace codebox {
using namespace std;

const int MAX_KILL_ROUNDS = 50;
const chrono::milliseconds KILL_ROUND_INTERVAL(2);

bool proc_stat::zombie() const {
    return state == 'Z' || state == 'X' || state == 'x';
}

optional<proc_stat> parse_proc_stat(const string &line) {
    // 切分后：[0] state [1] ppid [2] pgrp [3] session ... [19] starttime [20] vsize [21] rss
    size_t open = line.find('(');
    size_t paren = line.rfind(')');
    if (open == string::npos || paren == string::npos || paren < open) return nullopt;

    string rest = line.substr(paren + 1);
    boost::algorithm::trim(rest);
    vector<string> fields;
    boost::algorithm::split(fields, rest, boost::is_any_of(" "), boost::token_compress_on);
    if (fields.size() < 22 || fields[0].size() != 1) return nullopt;

    try {
        proc_stat stat;
        stat.pid = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(line.substr(0, open)));
        stat.state = fields[0][0];
        stat.ppid = boost::lexical_cast<pid_t>(fields[1]);
        stat.pgrp = boost::lexical_cast<pid_t>(fields[2]);
        stat.session = boost::lexical_cast<pid_t>(fields[3]);
        stat.start_time = boost::lexical_cast<uint64_t>(fields[19]);
        stat.rss_pages = boost::lexical_cast<int64_t>(fields[21]);
        return stat;
    } catch (const boost::bad_lexical_cast &) {
        return nullopt;
    }
}

vector<proc_stat> scan_processes(const string &proc_root) {
    vector<proc_stat> result;
    error_code ec;
    for (filesystem::directory_iterator it(proc_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!is_number(it->path().filename().string())) continue;

        ifstream fin(it->path() / "stat");
        string line;
        if (!fin || !getline(fin, line)) continue;

        if (auto stat = parse_proc_stat(line)) result.push_back(*stat);
    }
    if (ec) LOG(WARNING) << "unable to scan " << proc_root << ": " << ec.message();
    return result;
}

process_tree::process_tree(pid_t root, string proc_root)
    : root_(root), proc_root(move(proc_root)) {}

vector<proc_stat> process_tree::refresh() {
    vector<proc_stat> all = scan_processes(proc_root);

    // 种子：worker 本身、worker 的进程组和会话中的进程、以前见过的进程
    map<pid_t, vector<size_t>> children;
    vector<size_t> members;
    vector<bool> visited(all.size(), false);
    for (size_t i = 0; i < all.size(); ++i) {
        const proc_stat &p = all[i];
        children[p.ppid].push_back(i);

        auto known = tracked_.find(p.pid);
        if (p.pid == root_ || p.pgrp == root_ || p.session == root_ ||
            (known != tracked_.end() && known->second == p.start_time)) {
            visited[i] = true;
            members.push_back(i);
        }
    }

    // 种子的所有后代
    for (size_t k = 0; k < members.size(); ++k) {
        auto it = children.find(all[members[k]].pid);
        if (it == children.end()) continue;
        for (size_t child : it->second) {
            if (visited[child]) continue;
            visited[child] = true;
            members.push_back(child);
        }
    }

    vector<proc_stat> alive;
    for (size_t i : members) {
        tracked_[all[i].pid] = all[i].start_time;
        if (!all[i].zombie()) alive.push_back(all[i]);
    }
    return alive;
}

size_t process_tree::kill_all() {
    size_t signals = 0;
    for (int round = 0; round < MAX_KILL_ROUNDS; ++round) {
        vector<proc_stat> alive = refresh();
        if (alive.empty()) return signals;

        for (auto &p : alive) {
            if (kill(p.pid, SIGKILL) == 0)
                ++signals;
            else if (errno != ESRCH)
                throw system_error(errno, system_category(), fmt::format("sending SIGKILL to process {}", p.pid));
        }
        // SIGKILL 是异步送达的，等待进程真正退出后再扫描
        this_thread::sleep_for(KILL_ROUND_INTERVAL);
    }
    LOG(WARNING) << "descendants of worker " << root_ << " still alive after " << MAX_KILL_ROUNDS << " rounds of SIGKILL";
    return signals;
}

const map<pid_t, uint64_t> &process_tree::tracked() const {
    return tracked_;
}

pid_t process_tree::root() const {
    return root_;
}

}  // namespace codebox
