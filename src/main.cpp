#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <thread>
#include "starjudge/common/concurrent_queue.hpp"
#include "starjudge/common/io_utils.hpp"
#include "starjudge/common/utils.hpp"
#include "starjudge/compile_cache.hpp"
#include "starjudge/config.hpp"
#include "starjudge/judge/engine.hpp"
#include "starjudge/toolchain.hpp"
#include "starjudge/worker.hpp"
using namespace std;

namespace po = boost::program_options;

/**
 * @brief 读取配置项，命令行参数优先于环境变量，环境变量优先于默认值
 */
template <typename T>
static T read_option(const po::variables_map& vm, const char* option, const char* env, const T& def_value) {
    if (vm.count(option)) return vm.at(option).as<T>();
    if (auto value = starjudge::find_env(env)) return boost::lexical_cast<T>(*value);
    return def_value;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("starjudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("work-dir", po::value<string>(), "set the directory where per-run workspaces are created. You can either pass it from environ WORKDIR")
        ("cache-dir", po::value<string>(), "set the directory to store compiled executables, default to <work-dir>/cache. You can either pass it from environ CACHEDIR")
        ("compile-time-limit", po::value<int>(), "set wall time limit in milliseconds for compilers, default to 15000. You can either pass it from environ COMPILETIMELIMIT")
        ("run-time-limit", po::value<int>(), "set wall time limit in milliseconds for each run of user programs, default to 1500. You can either pass it from environ RUNTIMELIMIT")
        ("cache-max-entries", po::value<size_t>(), "set the maximum number of cached executables, 0 for unlimited. You can either pass it from environ CACHEMAXENTRIES")
        ("workers", po::value<size_t>(), "set the number of worker threads judging requests concurrently, default to 1. You can either pass it from environ WORKERS")
        ("request", po::value<string>(), "judge a single JSON request stored in the given file instead of reading JSON lines from stdin")
        ("no-warm-up", "do not run user programs once with empty input before judging test cases")
        ("check-toolchains", "print where compilers and interpreters are found, then exit")
        ("debug", "turn on the debug mode to keep workspaces for checking the validity of compilation and run results.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    size_t workers = 1;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);

        starjudge::WORK_DIR = read_option<string>(vm, "work-dir", "WORKDIR", starjudge::default_work_dir().string());
        starjudge::CACHE_DIR = read_option<string>(vm, "cache-dir", "CACHEDIR", (starjudge::WORK_DIR / "cache").string());
        starjudge::COMPILE_TIME_LIMIT = read_option<int>(vm, "compile-time-limit", "COMPILETIMELIMIT", starjudge::COMPILE_TIME_LIMIT);
        starjudge::RUN_TIME_LIMIT = read_option<int>(vm, "run-time-limit", "RUNTIMELIMIT", starjudge::RUN_TIME_LIMIT);
        starjudge::CACHE_MAX_ENTRIES = read_option<size_t>(vm, "cache-max-entries", "CACHEMAXENTRIES", starjudge::CACHE_MAX_ENTRIES);
        workers = read_option<size_t>(vm, "workers", "WORKERS", workers);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "starjudge: compile and run submitted code, judge it against test cases" << endl
             << "Requests are read as JSON lines from stdin, responses are written as JSON lines to stdout" << endl
             << "Optional Environment Variables:" << endl
             << "\tGPP_PATH, MINGW_HOME: location of g++" << endl
             << "\tJAVAC_PATH, JAVA_PATH, JAVA_HOME: location of javac and java" << endl
             << "\tPYTHON_PATH: location of python3" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "starjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        starjudge::DEBUG = true;
    }

    if (vm.count("check-toolchains")) {
        starjudge::toolchain_locator locator;
        for (auto& [t, resolution] : locator.report())
            cout << fmt::format("{:<7} {:<13} {}", starjudge::get_tool_name(t), resolution.source, resolution.path) << endl;
        return EXIT_SUCCESS;
    }

    CHECK(starjudge::COMPILE_TIME_LIMIT > 0) << "Compile time limit should be positive";
    CHECK(starjudge::RUN_TIME_LIMIT > 0) << "Run time limit should be positive";
    CHECK(workers > 0) << "At least one worker is required";

    // 让评测系统写入的文件只允许当前用户写入
    umask(0022);

    error_code ec;
    filesystem::create_directories(starjudge::WORK_DIR, ec);
    CHECK(filesystem::is_directory(starjudge::WORK_DIR))
        << "Work directory " << starjudge::WORK_DIR << " does not exist";
    filesystem::create_directories(starjudge::CACHE_DIR, ec);
    CHECK(filesystem::is_directory(starjudge::CACHE_DIR))
        << "Cache directory " << starjudge::CACHE_DIR << " does not exist";

    starjudge::compile_cache cache(starjudge::CACHE_DIR, starjudge::CACHE_MAX_ENTRIES);

    starjudge::judge_options options;
    options.warm_up = !vm.count("no-warm-up");
    starjudge::judge_engine engine(options, cache);

    for (auto& [t, resolution] : engine.get_toolchain().report())
        LOG(INFO) << "Using " << starjudge::get_tool_name(t) << " at " << resolution.path << " (" << resolution.source << ")";

    mutex output_mutex;
    starjudge::response_writer writer = [&output_mutex](const nlohmann::json& response) {
        // 选手程序的输出可能不是合法的 UTF-8
        string line = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        scoped_lock guard(output_mutex);
        cout << line << endl;
    };

    starjudge::concurrent_queue<string> request_queue;
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(starjudge::start_worker(i, engine, request_queue, writer));

    if (vm.count("request")) {
        filesystem::path request_file = vm.at("request").as<string>();
        CHECK(filesystem::is_regular_file(request_file))
            << "Request file " << request_file << " does not exist";
        request_queue.push(starjudge::read_file_content(request_file));
    } else {
        string line;
        while (getline(cin, line)) {
            boost::algorithm::trim(line);
            if (!line.empty()) request_queue.push(move(line));
        }
    }
    request_queue.close();

    for (auto& th : worker_threads)
        th.join();

    LOG(INFO) << "Compile cache: " << cache.hits() << " hits, " << cache.misses() << " misses, " << cache.size() << " entries";
    return 0;
}
