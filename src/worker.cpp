#include "starjudge/worker.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "starjudge/common/messages.hpp"
#include "starjudge/config.hpp"

namespace starjudge {
using namespace std;
using nlohmann::json;

static string malformed(const string &reason) {
    return "malformed request: " + reason;
}

/**
 * @brief 检查请求是否超过长度限制
 * @return 错误信息，没有超过限制时为空
 */
static string check_limits(const message::request &req) {
    if (req.code.size() > MAX_CODE_LENGTH)
        return fmt::format("code exceeds {} bytes", MAX_CODE_LENGTH);
    auto too_long = [](const string &input) { return input.size() > MAX_INPUT_LENGTH; };
    bool exceeded = too_long(req.input);
    for (auto &tc : req.testcases) exceeded = exceeded || too_long(tc.input);
    for (auto &input : req.inputs) exceeded = exceeded || too_long(input);
    if (exceeded)
        return fmt::format("input exceeds {} bytes", MAX_INPUT_LENGTH);
    return "";
}

json handle_request(judge_engine &engine, const json &request) {
    json id = request.is_object() && request.contains("id") ? request.at("id") : json();

    message::request req;
    try {
        req = request.get<message::request>();
    } catch (invalid_argument &ex) {
        return message::error_response(malformed(ex.what()), id);
    } catch (json::exception &ex) {
        return message::error_response(malformed(ex.what()), id);
    }

    string limit_error = check_limits(req);
    if (!limit_error.empty()) return message::error_response(limit_error, id);

    json response;
    switch (req.type) {
        case message::request_type::JUDGE:
            response = engine.judge(req.language, req.code, req.testcases);
            break;
        case message::request_type::RUN:
            response = engine.run_one(req.language, req.code, req.input, req.expected);
            break;
        case message::request_type::BATCH:
            response = engine.run_batch(req.language, req.code, req.inputs);
            break;
    }
    if (!id.is_null()) response["id"] = id;
    return response;
}

json handle_request_line(judge_engine &engine, const string &line) {
    json request;
    try {
        request = json::parse(line);
    } catch (json::parse_error &ex) {
        return message::error_response(malformed(ex.what()));
    }
    return handle_request(engine, request);
}

static void worker_loop(size_t worker_id, judge_engine &engine, concurrent_queue<string> &task_queue, const response_writer &writer) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (auto line = task_queue.pop()) {
        json response;
        try {
            response = handle_request_line(engine, *line);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when handling request, " << boost::diagnostic_information(ex);
            response = message::error_response(ex.what());
        }
        writer(response);
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, judge_engine &engine, concurrent_queue<string> &task_queue, response_writer writer) {
    return thread([worker_id, &engine, &task_queue, writer = move(writer)] {
        worker_loop(worker_id, engine, task_queue, writer);
    });
}

}  // namespace starjudge
