#include "service.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codebox {
using namespace std;
using namespace nlohmann;

service::service(executor &exec, istream &in, ostream &out, size_t threads)
    : exec(exec), in(in), out(out), threads(threads == 0 ? 1 : threads) {}

json service::success_response(const json &id, json data) {
    return {{"id", id}, {"success", true}, {"data", move(data)}};
}

json service::error_response(const json &id, const string &type, const string &message, const optional<string> &constraint) {
    json error = {{"type", type}, {"message", message}};
    if (constraint) error["constraint"] = *constraint;
    return {{"id", id}, {"success", false}, {"error", move(error)}};
}

static json get_id(const json &message) {
    if (message.is_object() && message.count("id")) return message.at("id");
    return nullptr;
}

static string get_op(const json &message) {
    if (!message.count("op") || message.at("op").is_null()) return "execute";
    if (!message.at("op").is_string()) throw invalid_argument("Field 'op' must be a string");
    return message.at("op").get<string>();
}

json service::handle(const json &message) {
    json id = get_id(message);
    if (!message.is_object()) return error_response(id, "BadRequest", "Request must be a JSON object");

    try {
        string op = get_op(message);
        if (op == "execute") {
            return success_response(id, exec.execute(message));
        } else if (op == "limits") {
            return success_response(id, exec.limits());
        } else if (op == "health") {
            return success_response(id, exec.health());
        } else {
            return error_response(id, "BadRequest", "Unknown op '" + op + "'");
        }
    } catch (validation_error &ex) {
        return error_response(id, "ValidationError", ex.what(), string(get_constraint_name(ex.violated)));
    } catch (invalid_argument &ex) {
        return error_response(id, "BadRequest", ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "request " << id.dump() << " failed: " << ex.what();
        return error_response(id, "InternalError", ex.what());
    }
}

void service::respond(const json &response) {
    lock_guard<mutex> lock(out_mutex);
    out << dump_safe(response) << endl;
}

void service::serve() {
    concurrent_queue<json> queue;
    vector<thread> pool;
    for (size_t i = 0; i < threads; ++i) {
        pool.emplace_back([&] {
            json message;
            while (queue.pop(message)) respond(handle(message));
        });
    }

    LOG(INFO) << "serving requests with " << threads << " threads";

    string line;
    while (getline(in, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;

        json message = json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            respond(error_response(nullptr, "BadRequest", "Malformed JSON"));
            continue;
        }

        string op;
        try {
            op = message.is_object() ? get_op(message) : "";
        } catch (invalid_argument &ex) {
            respond(error_response(get_id(message), "BadRequest", ex.what()));
            continue;
        }

        if (op == "execute") queue.push(move(message));
        else respond(handle(message));
    }

    queue.close();
    for (auto &t : pool) t.join();
    LOG(INFO) << "input closed, service stopped";
}

}  // namespace codebox
