#include "starjudge/toolchain.hpp"
#include <unistd.h>
#include <algorithm>
#include <boost/assign.hpp>
#include <system_error>
#include <unordered_map>
#include "starjudge/common/utils.hpp"

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<tool, const char *> tool_string = boost::assign::map_list_of
    (tool::GPP, "g++")
    (tool::JAVAC, "javac")
    (tool::JAVA, "java")
    (tool::PYTHON, "python");
// clang-format on

const char *get_tool_name(tool t) {
    return tool_string.at(t);
}

toolchain_probe toolchain_probe::system() {
    toolchain_probe probe;
    probe.getenv = [](const string &key) { return find_env(key); };
    probe.is_executable = [](const fs::path &path) {
        error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };
    probe.list_directories = [](const fs::path &parent) {
        vector<fs::path> dirs;
        error_code ec;
        for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec))
            if (it->is_directory(ec)) dirs.push_back(it->path());
        sort(dirs.begin(), dirs.end());
        return dirs;
    };
    return probe;
}

toolchain_resolver from_env(const string &var) {
    return [var](const toolchain_probe &probe) -> optional<fs::path> {
        if (auto value = probe.getenv(var)) return fs::path(*value);
        return nullopt;
    };
}

toolchain_resolver from_env_home(const string &var, const fs::path &relative) {
    return [var, relative](const toolchain_probe &probe) -> optional<fs::path> {
        auto home = probe.getenv(var);
        if (!home) return nullopt;
        fs::path candidate = fs::path(*home) / relative;
        if (probe.is_executable(candidate)) return candidate;
        return nullopt;
    };
}

toolchain_resolver from_install_roots(const vector<fs::path> &roots, const string &name) {
    return [roots, name](const toolchain_probe &probe) -> optional<fs::path> {
        for (auto &root : roots)
            if (probe.is_executable(root / name)) return root / name;
        return nullopt;
    };
}

toolchain_resolver from_subdirectories(const fs::path &parent, const fs::path &relative) {
    return [parent, relative](const toolchain_probe &probe) -> optional<fs::path> {
        for (auto &dir : probe.list_directories(parent))
            if (probe.is_executable(dir / relative)) return dir / relative;
        return nullopt;
    };
}

static const vector<fs::path> install_roots = {"/usr/local/bin", "/usr/bin", "/bin"};

toolchain_locator::toolchain_locator(toolchain_probe probe)
    : probe(move(probe)) {
    strategies[tool::GPP] = {"g++",
                             {{"env", from_env("GPP_PATH")},
                              {"env", from_env_home("MINGW_HOME", fs::path("bin") / "g++")},
                              {"install-root", from_install_roots(install_roots, "g++")}}};
    strategies[tool::JAVAC] = {"javac",
                               {{"env", from_env("JAVAC_PATH")},
                                {"env", from_env_home("JAVA_HOME", fs::path("bin") / "javac")},
                                {"install-root", from_install_roots(install_roots, "javac")},
                                {"install-root", from_subdirectories("/usr/lib/jvm", fs::path("bin") / "javac")}}};
    strategies[tool::JAVA] = {"java",
                              {{"env", from_env("JAVA_PATH")},
                               {"env", from_env_home("JAVA_HOME", fs::path("bin") / "java")},
                               {"install-root", from_install_roots(install_roots, "java")},
                               {"install-root", from_subdirectories("/usr/lib/jvm", fs::path("bin") / "java")}}};
    strategies[tool::PYTHON] = {"python3",
                                {{"env", from_env("PYTHON_PATH")},
                                 {"install-root", from_install_roots(install_roots, "python3")}}};
}

toolchain_resolution toolchain_locator::resolve(tool t) const {
    auto &strategy = strategies.at(t);
    for (auto &[source, resolver] : strategy.resolvers)
        if (auto path = resolver(probe)) return {*path, source};
    return {fs::path(strategy.command), "fallback"};
}

fs::path toolchain_locator::find(tool t) const {
    return resolve(t).path;
}

vector<pair<tool, toolchain_resolution>> toolchain_locator::report() const {
    vector<pair<tool, toolchain_resolution>> result;
    for (auto &entry : strategies)
        result.emplace_back(entry.first, resolve(entry.first));
    return result;
}

}  // namespace starjudge
