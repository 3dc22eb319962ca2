#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebox {
using namespace std;

codebox_exception::codebox_exception()
    : codebox_exception("") {}

codebox_exception::codebox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *codebox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const codebox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : codebox_exception() {}

internal_error::internal_error(const string &message)
    : codebox_exception(message) {}

const char *get_constraint_name(constraint c) {
    switch (c) {
        case constraint::CODE_EMPTY: return "code_empty";
        case constraint::CODE_TOO_LONG: return "code_too_long";
        case constraint::CODE_NOT_UTF8: return "code_not_utf8";
        case constraint::TIMEOUT_OUT_OF_RANGE: return "timeout_out_of_range";
        case constraint::MEMORY_OUT_OF_RANGE: return "memory_out_of_range";
        case constraint::INVALID_BINDING: return "invalid_binding";
        case constraint::BINDINGS_TOO_LARGE: return "bindings_too_large";
        case constraint::INVALID_FIELD: return "invalid_field";
    }
    return "unknown";
}

validation_error::validation_error(constraint violated, const string &message)
    : codebox_exception(message), violated(violated) {}

}  // namespace codebox
