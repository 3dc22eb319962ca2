#include "config.hpp"

namespace codebox {
using namespace std;

filesystem::path WORKER_PATH;
filesystem::path RUN_DIR = "/tmp/codebox";
int POLL_INTERVAL_MS = 50;
size_t OUTPUT_LIMIT = 1 << 20;         // 1M
size_t REPORT_LIMIT = 16 << 20;        // 16M
int ADDRESS_SPACE_HEADROOM_MB = 512;
size_t FILE_LIMIT = 64 << 20;          // 64M
size_t NPROC_LIMIT = 0;
size_t MAX_CONCURRENCY = 4;
bool USE_CGROUP = false;
bool DEBUG = false;

}  // namespace codebox
