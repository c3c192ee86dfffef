#include "starjudge/judge/classifier.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include "starjudge/common/io_utils.hpp"
#include "starjudge/config.hpp"

namespace starjudge {
using namespace std;

string normalize_output(const string &output) {
    string unified;
    unified.reserve(output.size());
    for (size_t i = 0; i < output.size(); ++i) {
        if (output[i] == '\r') {
            unified += '\n';
            if (i + 1 < output.size() && output[i + 1] == '\n') ++i;
        } else {
            unified += output[i];
        }
    }

    vector<string> lines;
    boost::algorithm::split(lines, unified, boost::algorithm::is_any_of("\n"));
    for (auto &line : lines)
        boost::algorithm::trim_right(line);
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return boost::algorithm::join(lines, "\n");
}

bool outputs_match(const string &actual, const string &expected) {
    return normalize_output(actual) == normalize_output(expected);
}

string truncate_message(const string &message) {
    return utf8_truncate(message, MESSAGE_LIMIT);
}

case_verdict classify_case(size_t index, const execution_outcome &outcome, const string &expected_output) {
    case_verdict verdict;
    verdict.index = index;
    verdict.time_ms = outcome.duration_ms;
    if (outcome.timed_out) {
        verdict.status = status::TIME_LIMIT_EXCEEDED;
        verdict.message = "time limit exceeded";
    } else if (outcome.exit_code != 0) {
        verdict.status = status::RUNTIME_ERROR;
        verdict.message = truncate_message(outcome.stderr_data.empty() ? "runtime error" : outcome.stderr_data);
    } else if (!outputs_match(outcome.stdout_data, expected_output)) {
        verdict.status = status::WRONG_ANSWER;
        verdict.message = "wrong answer";
    } else {
        verdict.status = status::ACCEPTED;
        verdict.message = "accepted";
    }
    return verdict;
}

status aggregate_status(const vector<case_verdict> &results) {
    status result = status::ACCEPTED;
    for (auto &verdict : results)
        result = worse_status(result, verdict.status);
    return result;
}

int compute_score(const vector<case_verdict> &results) {
    if (results.empty()) return 0;
    size_t passed = 0;
    for (auto &verdict : results)
        if (verdict.status == status::ACCEPTED) ++passed;
    return (int)lround(100.0 * passed / results.size());
}

}  // namespace starjudge
