#include "starjudge/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace starjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

ostream &operator<<(ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message, const filesystem::path &path, error_code ec)
    : judge_exception(message + " " + path.string() + (ec ? ": " + ec.message() : "")), path(path) {}

const filesystem::path &internal_error::get_path() const {
    return path;
}

process_error::process_error()
    : judge_exception() {}

process_error::process_error(const string &message)
    : judge_exception(message) {}

}  // namespace starjudge
