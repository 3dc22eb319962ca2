#include <unistd.h>
#include <iostream>
#include <system_error>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/messages.hpp"
#include "interpreter.hpp"
#include "python.hpp"
using namespace std;
using namespace codebox;

/**
 * codebox-python：执行一段用户代码的 worker
 *
 * 由 codebox 启动，从 fd 3 读取 worker_request，执行用户代码，
 * 将 worker_report 写入 fd 4 后退出。stdout、stderr 直接属于用户代码，
 * 因此 worker 不使用 glog，自身的错误只写到 stderr 并通过退出码报告。
 */
int main(int argc, char *argv[]) {
    message::worker_request request;
    try {
        string input = read_all(message::REQUEST_FD, message::MAX_REQUEST_SIZE);
        request = nlohmann::json::parse(input).get<message::worker_request>();
    } catch (std::exception &e) {
        cerr << "codebox-python: malformed request: " << e.what() << endl;
        return message::E_INTERNAL_ERROR;
    }
    if (close(message::REQUEST_FD) != 0) {
        cerr << "codebox-python: unable to close request pipe" << endl;
        return message::E_INTERNAL_ERROR;
    }

    try {
        python::interpreter interp(argc > 0 ? argv[0] : "codebox-python");

        message::worker_report report = python::run_snippet(request);
        write_all(message::REPORT_FD, nlohmann::dump_safe(nlohmann::json(report)));
        if (close(message::REPORT_FD) != 0)
            throw system_error(errno, system_category(), "closing report pipe");

        // 报告已经写出，此时刷新用户代码的标准流失败不影响执行结果
        if (interp.finalize() < 0)
            cerr << "codebox-python: unable to flush standard streams" << endl;
    } catch (python::python_error &e) {
        cerr << "codebox-python: " << e.what() << endl;
        return message::E_INTERNAL_ERROR;
    } catch (system_error &e) {
        cerr << "codebox-python: " << e.what() << endl;
        return message::E_INTERNAL_ERROR;
    }

    return message::E_SUCCESS;
}
