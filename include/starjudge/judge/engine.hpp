#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "starjudge/compile_cache.hpp"
#include "starjudge/judge/verdict.hpp"
#include "starjudge/language.hpp"
#include "starjudge/process.hpp"
#include "starjudge/toolchain.hpp"
#include "starjudge/workspace.hpp"

namespace starjudge {

struct judge_options {
    /**
     * @brief 所有工作目录的根目录，默认为 WORK_DIR
     */
    std::filesystem::path work_dir;

    /**
     * @brief 编译器的时钟时间限制，默认为 COMPILE_TIME_LIMIT
     */
    std::chrono::milliseconds compile_time_limit;

    /**
     * @brief 每次运行的时钟时间限制，默认为 RUN_TIME_LIMIT
     */
    std::chrono::milliseconds run_time_limit;

    /**
     * @brief 是否在运行测试点之前用空输入预先运行一次程序
     * 预热可以让 JVM、动态链接库等进入文件缓存，使第一个测试点的时间更稳定
     */
    bool warm_up = true;

    /**
     * @brief 评测结束后是否保留工作目录，默认为 DEBUG
     */
    bool keep_workspace;

    judge_options();
};

/**
 * @brief 评测引擎，负责单个提交的 编译 → 预热 → 逐个运行测试点 → 汇总
 *
 * 每次调用内部都是顺序执行的，不同调用之间可以并发，各自使用独立的工作目录，
 * 共享同一个编译缓存。所有公开操作都不抛出异常，内部错误转换为 Judge Error。
 */
struct judge_engine {
    judge_engine(judge_options options, compile_cache &cache, toolchain_locator toolchain = toolchain_locator());

    /**
     * @brief 评测一份代码
     * @param language 语言名，比如 "C++"
     * @param code 源代码
     * @param cases 测试数据，按顺序评测，不能为空
     */
    judge_verdict judge(const std::string &language, const std::string &code, const std::vector<test_case> &cases);

    /**
     * @brief 运行一次样例
     * @param expected 若提供了标准输出，程序正常结束时比较输出，结果为 Accepted 或 Wrong Answer
     */
    sample_result run_one(const std::string &language, const std::string &code, const std::string &input, const std::optional<std::string> &expected = std::nullopt);

    /**
     * @brief 按顺序运行一组样例，遇到第一个没有正常结束的样例时停止
     */
    batch_result run_batch(const std::string &language, const std::string &code, const std::vector<std::string> &inputs);

    const judge_options &get_options() const;
    const toolchain_locator &get_toolchain() const;

private:
    std::unique_ptr<workspace> prepare(language lang, const std::string &code);
    compile_outcome compile(workspace &ws, language lang, const std::string &code);
    void warm_up(workspace &ws);
    execution_outcome execute(workspace &ws, const std::string &input);

    judge_options options;
    compile_cache &cache;
    toolchain_locator toolchain;
};

}  // namespace starjudge
