#include "gtest/gtest.h"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "memory_sampler.hpp"
#include "process_tree.hpp"

using namespace std;
using namespace codebox;
namespace fs = std::filesystem;

// 字段依次为 pid (comm) state ppid pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
// utime stime cutime cstime priority nice num_threads itrealvalue starttime vsize rss ...
static string make_stat_line(int pid, int ppid, int pgrp, int session, long rss, char state = 'S') {
    return to_string(pid) + " (python3) " + state + " " + to_string(ppid) + " " + to_string(pgrp) + " " +
           to_string(session) + " 0 -1 4194560 120 0 0 0 3 1 0 0 20 0 1 0 123456 24776704 " + to_string(rss) +
           " 18446744073709551615 1 1 0 0 0 0 0 0 0 0 0 0 17 3 0 0 0 0 0";
}

class MemorySamplerTest : public ::testing::Test {
protected:
    MemorySamplerTest() : root(fs::temp_directory_path() / ("codebox-sampler-" + to_string(getpid()))) {
        fs::remove_all(root);
    }

    ~MemorySamplerTest() override {
        fs::remove_all(root);
    }

    void write_stat(int pid, const string &content) {
        fs::create_directories(root / to_string(pid));
        ofstream(root / to_string(pid) / "stat") << content << "\n";
    }

    fs::path root;
};

TEST_F(MemorySamplerTest, SumsWholeTreeTest) {
    write_stat(100, make_stat_line(100, 1, 100, 100, 10));
    write_stat(101, make_stat_line(101, 100, 100, 100, 5));
    // 调用 setsid 离开了会话的子进程及其子进程
    write_stat(102, make_stat_line(102, 100, 102, 102, 1000));
    write_stat(103, make_stat_line(103, 102, 102, 102, 2000));
    write_stat(200, make_stat_line(200, 1, 200, 200, 7777));

    process_tree tree(100, root.string());
    process_tree_sampler sampler(tree);
    EXPECT_EQ(sampler.sample(), (10 + 5 + 1000 + 2000) * sysconf(_SC_PAGESIZE));
}

TEST_F(MemorySamplerTest, SkipsZombieTest) {
    write_stat(100, make_stat_line(100, 1, 100, 100, 10));
    write_stat(101, make_stat_line(101, 100, 100, 100, 0, 'Z'));

    process_tree tree(100, root.string());
    process_tree_sampler sampler(tree);
    EXPECT_EQ(sampler.sample(), 10 * sysconf(_SC_PAGESIZE));
}

TEST_F(MemorySamplerTest, MissingProcTest) {
    process_tree tree(100, (root / "missing").string());
    process_tree_sampler sampler(tree);
    EXPECT_EQ(sampler.sample(), 0);
}

TEST_F(MemorySamplerTest, CurrentProcessTest) {
    process_tree tree(getpid());
    process_tree_sampler sampler(tree);
    EXPECT_GT(sampler.sample(), 0);
}
