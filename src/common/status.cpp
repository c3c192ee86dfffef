#include "starjudge/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace starjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::COMPILATION_ERROR, "Compile Error")
    (status::SYSTEM_ERROR, "Judge Error")
    (status::OK, "OK");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

optional<status> parse_status(const string &name) {
    for (auto &[stat, display] : status_string)
        if (name == display) return stat;
    return nullopt;
}

int get_priority(status stat) {
    switch (stat) {
        case status::ACCEPTED:
            return 0;
        case status::WRONG_ANSWER:
            return 1;
        case status::RUNTIME_ERROR:
            return 2;
        case status::TIME_LIMIT_EXCEEDED:
            return 3;
        default:
            return 4;
    }
}

status worse_status(status current, status candidate) {
    return get_priority(candidate) > get_priority(current) ? candidate : current;
}

}  // namespace starjudge
