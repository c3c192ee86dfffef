#include "starjudge/common/messages.hpp"
#include <stdexcept>
#include "starjudge/common/io_utils.hpp"
#include "starjudge/common/json_utils.hpp"
#include "starjudge/config.hpp"

namespace starjudge::message {
using namespace std;

static request_type parse_request_type(const string &type) {
    if (type == "judge") return request_type::JUDGE;
    if (type == "run") return request_type::RUN;
    if (type == "batch") return request_type::BATCH;
    throw invalid_argument("unknown request type: " + type);
}

void from_json(const nlohmann::json &j, request &req) {
    if (!j.is_object()) throw invalid_argument("request must be a JSON object");

    req.type = parse_request_type(nlohmann::get_value_def<string>(j, "judge", "type"));
    req.id = j.contains("id") ? j.at("id") : nlohmann::json();
    req.language = nlohmann::get_value<string>(j, "language");
    req.code = nlohmann::get_value<string>(j, "code");

    switch (req.type) {
        case request_type::JUDGE: {
            const nlohmann::json &testcases = nlohmann::access(j, "testcases");
            if (!testcases.is_array()) throw invalid_argument("unexpected value type of: testcases");
            for (auto &testcase : testcases) {
                test_case tc;
                tc.input = nlohmann::get_value_def<string>(testcase, "", "input");
                tc.expected_output = nlohmann::get_value<string>(testcase, "output");
                req.testcases.push_back(move(tc));
            }
        } break;
        case request_type::RUN: {
            req.input = nlohmann::get_value_def<string>(j, "", "input");
            if (nlohmann::exists(j, "expected")) req.expected = nlohmann::get_value<string>(j, "expected");
        } break;
        case request_type::BATCH: {
            req.inputs = nlohmann::get_value<vector<string>>(j, "inputs");
        } break;
    }
}

nlohmann::json error_response(const string &message, const nlohmann::json &id) {
    nlohmann::json j = {{"status", get_display_message(status::SYSTEM_ERROR)},
                        {"message", utf8_truncate(message, MESSAGE_LIMIT)}};
    if (!id.is_null()) j["id"] = id;
    return j;
}

}  // namespace starjudge::message

namespace starjudge {
using namespace std;

void to_json(nlohmann::json &j, const case_verdict &verdict) {
    j = {{"index", verdict.index},
         {"status", get_display_message(verdict.status)},
         {"message", verdict.message},
         {"timeMs", verdict.time_ms}};
}

void to_json(nlohmann::json &j, const judge_verdict &verdict) {
    j = {{"status", get_display_message(verdict.status)},
         {"message", verdict.message},
         {"timeMs", verdict.time_ms},
         {"results", verdict.results},
         {"score", verdict.score},
         {"cached", verdict.cached}};
}

void to_json(nlohmann::json &j, const sample_result &result) {
    j = {{"status", get_display_message(result.status)},
         {"message", result.message},
         {"output", result.output},
         {"timeMs", result.time_ms},
         {"cached", result.cached}};
    if (result.expected) j["expected"] = *result.expected;
}

void to_json(nlohmann::json &j, const batch_item &item) {
    j = {{"index", item.index},
         {"status", get_display_message(item.status)},
         {"message", item.message},
         {"output", item.output},
         {"timeMs", item.time_ms}};
}

void to_json(nlohmann::json &j, const batch_result &result) {
    j = {{"status", get_display_message(result.status)},
         {"message", result.message},
         {"results", result.results},
         {"cached", result.cached}};
}

}  // namespace starjudge
