#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>
#include "cgroup.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "monitor/audit_log.hpp"
#include "service.hpp"
using namespace std;

/**
 * @brief 从命令行参数或环境变量中读取配置，命令行参数优先
 */
template <typename T>
static bool read_option(const boost::program_options::variables_map& vm, const char* option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

static int execute_request(codebox::executor& exec, const string& path) {
    nlohmann::json body;
    try {
        if (path == "-") {
            body = nlohmann::json::parse(cin);
        } else {
            body = nlohmann::json::parse(codebox::read_file_content(path));
        }
    } catch (nlohmann::json::exception& e) {
        cerr << "Malformed request " << path << ": " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (system_error& e) {
        cerr << "Unable to read request " << path << ": " << e.what() << endl;
        return EXIT_FAILURE;
    }

    try {
        codebox::execution_result result = exec.execute(body);
        cout << nlohmann::dump_safe(nlohmann::json(result), 4) << endl;
        return EXIT_SUCCESS;
    } catch (codebox::validation_error& e) {
        cout << nlohmann::dump_safe(codebox::service::error_response(nullptr, "ValidationError", e.what(), string(codebox::get_constraint_name(e.violated))), 4) << endl;
        return EXIT_FAILURE;
    } catch (codebox::internal_error& e) {
        LOG(ERROR) << e;
        cout << nlohmann::dump_safe(codebox::service::error_response(nullptr, "InternalError", e.what()), 4) << endl;
        return 2;
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("codebox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "execute one request read from the given JSON file, or from stdin if the path is -, and print the result")
        ("serve", "serve JSON requests line by line from stdin, writing one JSON response per line to stdout")
        ("limits", "print the request limits accepted by the engine")
        ("health", "print whether the engine is able to accept new work")
        ("worker", po::value<string>(), "set the path of the codebox-python worker executable. You can either pass it from environ CODEBOX_WORKER")
        ("run-dir", po::value<string>(), "set the directory to create per-run working directories in. You can either pass it from environ RUNDIR")
        ("concurrency", po::value<size_t>(), "set the maximum number of workers running at the same time, default to the number of hardware threads. You can either pass it from environ CONCURRENCY")
        ("poll-interval", po::value<int>(), "set the resource sampling interval in milliseconds (10-1000), default to 50. You can either pass it from environ POLLINTERVAL")
        ("output-limit", po::value<size_t>(), "set the maximum captured size in KB of each of stdout and stderr, default to 1024. You can either pass it from environ OUTPUTLIMIT")
        ("file-limit", po::value<size_t>(), "set the maximum size in KB of files created by user code, default to 65536. You can either pass it from environ FILELIMIT")
        ("nproc", po::value<size_t>(), "set the maximum number of processes, only effective when workers run as a dedicated user. You can either pass it from environ NPROCLIMIT")
        ("cgroup", "account memory and kill workers through a per-run memory cgroup, requires root privilege and cgroup v1")
        ("debug", "turn on the debug mode to keep the working directory of each run for inspection")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebox: run untrusted Python snippets in isolated, resource limited worker processes" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("debug") || getenv("DEBUG")) {
            codebox::DEBUG = true;
        }

        string worker;
        if (read_option(vm, "worker", "CODEBOX_WORKER", worker)) {
            codebox::WORKER_PATH = filesystem::path(worker);
        } else {
            // 默认情况下，假设 codebox-python 和 codebox 编译在同一个文件夹
            codebox::WORKER_PATH = bin_dir / "codebox-python";
        }

        string run_dir;
        if (read_option(vm, "run-dir", "RUNDIR", run_dir)) {
            codebox::RUN_DIR = filesystem::path(run_dir);
        }
        filesystem::create_directories(codebox::RUN_DIR);
        CHECK(filesystem::is_directory(codebox::RUN_DIR))
            << "Run directory " << codebox::RUN_DIR << " does not exist";

        size_t concurrency = thread::hardware_concurrency();
        if (!read_option(vm, "concurrency", "CONCURRENCY", concurrency) && concurrency == 0) {
            concurrency = codebox::MAX_CONCURRENCY;
        }
        CHECK(concurrency > 0) << "Concurrency should be positive";
        codebox::MAX_CONCURRENCY = concurrency;

        read_option(vm, "poll-interval", "POLLINTERVAL", codebox::POLL_INTERVAL_MS);
        CHECK(codebox::POLL_INTERVAL_MS >= 10 && codebox::POLL_INTERVAL_MS <= 1000)
            << "Poll interval should be between 10 and 1000 milliseconds";

        size_t output_limit;
        if (read_option(vm, "output-limit", "OUTPUTLIMIT", output_limit)) {
            codebox::OUTPUT_LIMIT = output_limit * 1024;
        }

        size_t file_limit;
        if (read_option(vm, "file-limit", "FILELIMIT", file_limit)) {
            codebox::FILE_LIMIT = file_limit * 1024;
        }

        read_option(vm, "nproc", "NPROCLIMIT", codebox::NPROC_LIMIT);

        if (vm.count("cgroup")) {
            if (getuid() != 0) {
                cerr << "You should run this program in privileged mode to use cgroups" << endl;
                return EXIT_FAILURE;
            }
            codebox::cgroup_guard::init();
            codebox::USE_CGROUP = true;
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (codebox::cgroup_exception& e) {
        cerr << "Unable to initialize cgroups: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (filesystem::filesystem_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    // 让执行引擎创建的工作目录只允许当前用户写入
    umask(0022);

    codebox::executor exec(codebox::MAX_CONCURRENCY);
    exec.register_monitor(make_unique<codebox::audit_log>());

    if (vm.count("limits")) {
        cout << exec.limits().dump(4) << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("health")) {
        cout << exec.health().dump(4) << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("request")) {
        return execute_request(exec, vm.at("request").as<string>());
    }

    if (vm.count("serve")) {
        codebox::service svc(exec, cin, cout, codebox::MAX_CONCURRENCY);
        svc.serve();
        return EXIT_SUCCESS;
    }

    cerr << "One of --request, --serve, --limits or --health is required" << endl
         << endl;
    cerr << desc << endl;
    return EXIT_FAILURE;
}
