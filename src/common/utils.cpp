#include "starjudge/common/utils.hpp"
#include <stdlib.h>
#include <unistd.h>

extern char **environ;

namespace starjudge {
using namespace std;

optional<string> find_env(const string &key) {
    char *result = getenv(key.c_str());
    if (!result || !*result) return nullopt;
    return string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

vector<string> build_environment(const map<string, string> &overrides) {
    vector<string> result;
    for (char **env = environ; env && *env; ++env) {
        string entry(*env);
        auto eq = entry.find('=');
        if (eq != string::npos && overrides.count(entry.substr(0, eq)))
            continue;  // 将被 overrides 覆盖
        result.push_back(move(entry));
    }
    for (auto &[key, value] : overrides)
        result.push_back(key + "=" + value);
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace starjudge
