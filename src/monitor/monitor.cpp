#include "monitor/monitor.hpp"

namespace codebox {
using namespace std;

monitor::~monitor() = default;

void monitor::start_execution(const string &, const execution_request &) {}

void monitor::end_execution(const string &, const execution_request &, const execution_result &) {}

void monitor::report_error(const string &) {}

}  // namespace codebox
