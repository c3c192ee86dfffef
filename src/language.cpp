#include "starjudge/language.hpp"
#include <map>

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

static const map<string, language> language_names = {
    {"C++", language::CPP},
    {"Python", language::PYTHON},
    {"Java", language::JAVA},
    {"cpp", language::CPP},
    {"python", language::PYTHON},
    {"java", language::JAVA}};

optional<language> parse_language(const string &name) {
    auto it = language_names.find(name);
    if (it == language_names.end()) return nullopt;
    return it->second;
}

const char *get_language_name(language lang) {
    switch (lang) {
        case language::CPP:
            return "C++";
        case language::PYTHON:
            return "Python";
        case language::JAVA:
            return "Java";
    }
    return "Unknown";
}

optional<command> language_profile::compile_command(const toolchain_locator &toolchain, const fs::path &workdir) const {
    switch (lang) {
        case language::CPP:
            // g++ main.cpp -O2 -std=c++17 -o main
            return command{toolchain.find(tool::GPP), {(workdir / source_file).string(), "-O2", "-std=c++17", "-o", (workdir / artifact_file).string()}};
        case language::JAVA:
            return command{toolchain.find(tool::JAVAC), {(workdir / source_file).string()}};
        default:
            return nullopt;
    }
}

command language_profile::run_command(const toolchain_locator &toolchain, const fs::path &workdir) const {
    switch (lang) {
        case language::CPP:
            return {workdir / artifact_file, {}};
        case language::PYTHON:
            return {toolchain.find(tool::PYTHON), {(workdir / source_file).string()}};
        case language::JAVA:
            // java -cp <workdir> Main，类名为 artifact_file 去掉 .class
            return {toolchain.find(tool::JAVA), {"-cp", workdir.string(), fs::path(artifact_file).stem().string()}};
    }
    return {};
}

bool language_profile::compiled() const {
    return !artifact_file.empty();
}

const language_profile &get_language_profile(language lang) {
    static const map<language, language_profile> profiles = {
        {language::CPP, {language::CPP, "main.cpp", "main", "exe"}},
        {language::PYTHON, {language::PYTHON, "main.py", "", ""}},
        {language::JAVA, {language::JAVA, "Main.java", "Main.class", "class"}}};
    return profiles.at(lang);
}

}  // namespace starjudge
