#include "common/messages.hpp"
#include "common/json_utils.hpp"

namespace codebox::message {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const worker_request &request) {
    j = {{"code", request.code},
         {"bindings", request.bindings},
         {"capture", request.capture}};
}

void from_json(const json &j, worker_request &request) {
    j.at("code").get_to(request.code);
    request.bindings = access_optional(j, "bindings");
    if (request.bindings.is_null()) request.bindings = json::object();
    if (!request.bindings.is_object())
        throw build_invalid_argument(j, "bindings");
    assign_optional(j, request.capture, "capture");
}

void to_json(json &j, const worker_report &report) {
    auto optional_string = [](const string &s) { return s.empty() ? json() : json(s); };
    j = {{"status", report.ok ? "ok" : "error"},
         {"kind", optional_string(report.kind)},
         {"exception_type", optional_string(report.exception_type)},
         {"message", optional_string(report.message)},
         {"traceback", optional_string(report.traceback)},
         {"bindings", report.bindings ? *report.bindings : json()}};
}

void from_json(const json &j, worker_report &report) {
    string status = get_value<string>(j, "status");
    if (status == "ok")
        report.ok = true;
    else if (status == "error")
        report.ok = false;
    else
        throw invalid_argument("Unrecognized report status " + status);
    assign_optional(j, report.kind, "kind");
    assign_optional(j, report.exception_type, "exception_type");
    assign_optional(j, report.message, "message");
    assign_optional(j, report.traceback, "traceback");
    if (exists(j, "bindings")) {
        if (!j.at("bindings").is_object())
            throw build_invalid_argument(j, "bindings");
        report.bindings = j.at("bindings");
    }
}

optional<worker_report> parse_worker_report(const string &text) {
    if (text.empty()) return nullopt;
    try {
        return json::parse(text).get<worker_report>();
    } catch (json::exception &) {
        return nullopt;
    } catch (invalid_argument &) {
        return nullopt;
    }
}

}  // namespace codebox::message
