#include "memory_sampler.hpp"
#include <unistd.h>
#include "cgroup.hpp"
#include "process_tree.hpp"

namespace codebox {
using namespace std;

process_tree_sampler::process_tree_sampler(process_tree &tree) : tree(tree) {
    page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) page_size = 4096;
}

int64_t process_tree_sampler::sample() {
    int64_t pages = 0;
    for (auto &p : tree.refresh())
        if (p.rss_pages > 0) pages += p.rss_pages;
    return pages * page_size;
}

cgroup_sampler::cgroup_sampler(run_cgroup &cg) : cg(cg) {}

int64_t cgroup_sampler::sample() {
    return cg.memory_usage();
}

}  // namespace codebox
