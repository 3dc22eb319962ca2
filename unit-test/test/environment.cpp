#include "test/environment.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <filesystem>
#include "config.hpp"

namespace codebox {
using namespace std;

static filesystem::path test_root() {
    return filesystem::path("/tmp/codebox-test") / to_string(getpid());
}

void setup_test_environment() {
    if (getenv("DEBUG")) codebox::DEBUG = true;

    codebox::WORKER_PATH = filesystem::path(CODEBOX_WORKER_PATH);
    CHECK(filesystem::is_regular_file(codebox::WORKER_PATH))
        << "Worker executable " << codebox::WORKER_PATH << " does not exist";

    codebox::RUN_DIR = test_root() / "run";
    filesystem::create_directories(codebox::RUN_DIR);
}

void teardown_test_environment() {
    if (codebox::DEBUG) return;
    error_code ec;
    filesystem::remove_all(test_root(), ec);
}

nlohmann::json make_request(const string &code) {
    return {{"code", code}};
}

}  // namespace codebox
