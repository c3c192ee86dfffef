#include "starjudge/judge/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <system_error>
#include "starjudge/common/exceptions.hpp"
#include "starjudge/config.hpp"
#include "starjudge/judge/classifier.hpp"

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

judge_options::judge_options()
    : work_dir(WORK_DIR),
      compile_time_limit(COMPILE_TIME_LIMIT),
      run_time_limit(RUN_TIME_LIMIT),
      keep_workspace(DEBUG) {}

judge_engine::judge_engine(judge_options options, compile_cache &cache, toolchain_locator toolchain)
    : options(move(options)), cache(cache), toolchain(move(toolchain)) {}

const judge_options &judge_engine::get_options() const {
    return options;
}

const toolchain_locator &judge_engine::get_toolchain() const {
    return toolchain;
}

static string error_message(const char *operation, const exception &ex) {
    string message = ex.what();
    return truncate_message(message.empty() ? string(operation) + " failed" : message);
}

/**
 * @brief 内部错误的统一处理：记录日志，并返回截断后的错误信息
 */
static string report_error(const char *operation, const judge_exception &ex) {
    LOG(ERROR) << operation << " failed: " << ex;
    return error_message(operation, ex);
}

static string report_error(const char *operation, const exception &ex) {
    LOG(ERROR) << operation << " failed: " << boost::diagnostic_information(ex);
    return error_message(operation, ex);
}

static string unsupported_language(const string &name) {
    return truncate_message(fmt::format("unsupported language: {}", name));
}

/**
 * @brief 统计目录中的 .class 文件个数
 * 含有内部类或多个顶层类的 Java 程序会生成多个 .class 文件，这样的程序不放入编译缓存
 */
static size_t count_class_files(const fs::path &dir) {
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(dir))
        if (entry.path().extension() == ".class") ++count;
    return count;
}

unique_ptr<workspace> judge_engine::prepare(language lang, const string &code) {
    auto ws = create_workspace(options.work_dir, lang, code);
    if (options.keep_workspace) ws->keep();
    return ws;
}

compile_outcome judge_engine::compile(workspace &ws, language lang, const string &code) {
    compile_outcome result;
    const language_profile &profile = ws.profile;
    if (!profile.compiled()) {
        result.ok = true;
        return result;
    }

    string key = compile_cache::hash_key(lang, code);
    if (auto cached = cache.get(key)) {
        error_code ec;
        fs::copy_file(*cached, ws.executable_path, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            LOG(INFO) << "Compile cache hit " << key << " (" << get_language_name(lang) << ")";
            result.ok = result.cached = true;
            return result;
        }
        // 缓存文件可能恰好被删除，重新编译即可
        LOG(WARNING) << "Unable to copy cached artifact " << *cached << ": " << ec.message();
    } else {
        LOG(INFO) << "Compile cache miss " << key << " (" << get_language_name(lang) << ")";
    }

    auto cmd = profile.compile_command(toolchain, ws.root);
    run_options opts;
    opts.cwd = ws.root;
    opts.timeout = options.compile_time_limit;
    execution_outcome outcome = run_process(cmd->executable, cmd->args, opts);
    result.time_ms = outcome.duration_ms;

    if (outcome.timed_out) {
        result.status = status::COMPILATION_ERROR;
        result.message = "compilation timed out";
        return result;
    }
    if (outcome.exit_code != 0) {
        result.status = status::COMPILATION_ERROR;
        const string &diagnostics = !outcome.stderr_data.empty() ? outcome.stderr_data : outcome.stdout_data;
        result.message = truncate_message(diagnostics.empty() ? "compilation failed" : diagnostics);
        return result;
    }
    if (!fs::exists(ws.executable_path)) {
        result.status = status::COMPILATION_ERROR;
        result.message = fmt::format("compilation failed: {} was not produced", profile.artifact_file);
        return result;
    }

    result.ok = true;
    if (lang == language::JAVA && count_class_files(ws.root) != 1)
        LOG(INFO) << "Not caching " << key << ": compilation produced more than one class file";
    else
        cache.put(key, ws.executable_path, profile.cache_extension);
    return result;
}

void judge_engine::warm_up(workspace &ws) {
    if (!options.warm_up) return;
    try {
        execute(ws, "");
    } catch (const exception &ex) {
        // 预热失败不影响评测
        LOG(WARNING) << "Warm-up run failed: " << ex.what();
    }
}

execution_outcome judge_engine::execute(workspace &ws, const string &input) {
    command cmd = ws.profile.run_command(toolchain, ws.root);
    run_options opts;
    opts.cwd = ws.root;
    opts.input = input;
    opts.timeout = options.run_time_limit;
    return run_process(cmd.executable, cmd.args, opts);
}

judge_verdict judge_engine::judge(const string &lang_name, const string &code, const vector<test_case> &cases) {
    judge_verdict verdict;
    try {
        auto lang = parse_language(lang_name);
        if (!lang) {
            verdict.status = status::SYSTEM_ERROR;
            verdict.message = unsupported_language(lang_name);
            return verdict;
        }
        if (cases.empty()) {
            verdict.status = status::SYSTEM_ERROR;
            verdict.message = "no test cases";
            return verdict;
        }

        auto ws = prepare(*lang, code);
        compile_outcome compiled = compile(*ws, *lang, code);
        verdict.cached = compiled.cached;
        if (!compiled.ok) {
            // 编译错误时报告编译所用的时间
            verdict.status = compiled.status;
            verdict.message = compiled.message;
            verdict.time_ms = compiled.time_ms;
            return verdict;
        }

        warm_up(*ws);

        for (size_t i = 0; i < cases.size(); ++i) {
            execution_outcome outcome = execute(*ws, cases[i].input);
            verdict.results.push_back(classify_case(i, outcome, cases[i].expected_output));
            verdict.time_ms += outcome.duration_ms;
        }

        verdict.status = aggregate_status(verdict.results);
        verdict.message = get_display_message(verdict.status);
        verdict.score = compute_score(verdict.results);
        LOG(INFO) << "Judged " << get_language_name(*lang) << " submission: " << verdict.message << ", score " << verdict.score;
    } catch (const judge_exception &ex) {
        verdict = judge_verdict();
        verdict.message = report_error("judge", ex);
    } catch (const exception &ex) {
        verdict = judge_verdict();
        verdict.message = report_error("judge", ex);
    }
    return verdict;
}

sample_result judge_engine::run_one(const string &lang_name, const string &code, const string &input, const optional<string> &expected) {
    sample_result result;
    result.expected = expected;
    try {
        auto lang = parse_language(lang_name);
        if (!lang) {
            result.status = status::SYSTEM_ERROR;
            result.message = unsupported_language(lang_name);
            return result;
        }

        auto ws = prepare(*lang, code);
        compile_outcome compiled = compile(*ws, *lang, code);
        result.cached = compiled.cached;
        if (!compiled.ok) {
            result.status = compiled.status;
            result.message = compiled.message;
            result.time_ms = 0;
            return result;
        }

        warm_up(*ws);

        execution_outcome outcome = execute(*ws, input);
        result.output = outcome.stdout_data;
        result.time_ms = outcome.duration_ms;
        if (outcome.timed_out) {
            result.status = status::TIME_LIMIT_EXCEEDED;
            result.message = "time limit exceeded";
        } else if (outcome.exit_code != 0) {
            result.status = status::RUNTIME_ERROR;
            result.message = truncate_message(outcome.stderr_data.empty() ? "runtime error" : outcome.stderr_data);
        } else if (!expected) {
            result.status = status::OK;
            result.message = "finished";
        } else if (outputs_match(outcome.stdout_data, *expected)) {
            result.status = status::ACCEPTED;
            result.message = "accepted";
        } else {
            result.status = status::WRONG_ANSWER;
            result.message = "wrong answer";
        }
    } catch (const judge_exception &ex) {
        result.status = status::SYSTEM_ERROR;
        result.message = report_error("run", ex);
        result.output.clear();
        result.time_ms = 0;
    } catch (const exception &ex) {
        result.status = status::SYSTEM_ERROR;
        result.message = report_error("run", ex);
        result.output.clear();
        result.time_ms = 0;
    }
    return result;
}

batch_result judge_engine::run_batch(const string &lang_name, const string &code, const vector<string> &inputs) {
    batch_result result;
    try {
        auto lang = parse_language(lang_name);
        if (!lang) {
            result.status = status::SYSTEM_ERROR;
            result.message = unsupported_language(lang_name);
            return result;
        }

        auto ws = prepare(*lang, code);
        compile_outcome compiled = compile(*ws, *lang, code);
        result.cached = compiled.cached;
        if (!compiled.ok) {
            result.status = compiled.status;
            result.message = compiled.message;
            return result;
        }

        warm_up(*ws);

        result.status = status::OK;
        result.message = "finished";
        for (size_t i = 0; i < inputs.size(); ++i) {
            execution_outcome outcome = execute(*ws, inputs[i]);
            batch_item item;
            item.index = i;
            item.output = outcome.stdout_data;
            item.time_ms = outcome.duration_ms;
            if (outcome.timed_out) {
                item.status = status::TIME_LIMIT_EXCEEDED;
                item.message = "time limit exceeded";
            } else if (outcome.exit_code != 0) {
                item.status = status::RUNTIME_ERROR;
                item.message = truncate_message(outcome.stderr_data.empty() ? "runtime error" : outcome.stderr_data);
            } else {
                item.status = status::OK;
                item.message = "finished";
            }
            result.results.push_back(move(item));

            if (result.results.back().status != status::OK) {
                result.status = result.results.back().status;
                result.message = result.status == status::TIME_LIMIT_EXCEEDED ? "time limit exceeded" : "runtime error";
                break;
            }
        }
    } catch (const judge_exception &ex) {
        result = batch_result();
        result.message = report_error("batch run", ex);
    } catch (const exception &ex) {
        result = batch_result();
        result.message = report_error("batch run", ex);
    }
    return result;
}

}  // namespace starjudge
