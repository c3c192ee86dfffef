#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "starjudge/common/status.hpp"

namespace starjudge {

/**
 * @brief 一组输入数据和标准输出
 */
struct test_case {
    std::string input;
    std::string expected_output;
};

/**
 * @brief 一个测试点的评测结果
 */
struct case_verdict {
    std::size_t index = 0;

    /**
     * @brief ACCEPTED、WRONG_ANSWER、RUNTIME_ERROR、TIME_LIMIT_EXCEEDED 之一
     */
    starjudge::status status = starjudge::status::ACCEPTED;

    std::string message;

    long long time_ms = 0;
};

/**
 * @brief 一次提交的评测结果
 */
struct judge_verdict {
    starjudge::status status = starjudge::status::SYSTEM_ERROR;

    std::string message;

    /**
     * @brief 所有测试点运行时间之和，单位为毫秒
     */
    long long time_ms = 0;

    /**
     * @brief 每个测试点的评测结果，编译错误时为空
     */
    std::vector<case_verdict> results;

    /**
     * @brief 通过测试点的百分比，四舍五入到整数
     */
    int score = 0;

    /**
     * @brief 编译步骤是否命中了编译缓存
     */
    bool cached = false;
};

/**
 * @brief 编译步骤的结果
 */
struct compile_outcome {
    bool ok = false;

    /**
     * @brief 编译产物是否来自编译缓存
     */
    bool cached = false;

    /**
     * @brief 编译失败时为 COMPILATION_ERROR 或 SYSTEM_ERROR
     */
    starjudge::status status = starjudge::status::OK;

    std::string message;

    long long time_ms = 0;
};

/**
 * @brief 运行单个样例的结果
 */
struct sample_result {
    /**
     * @brief 没有提供标准输出时，程序正常结束为 OK；
     * 提供了标准输出时为 ACCEPTED 或 WRONG_ANSWER。
     * 其他可能的值为 RUNTIME_ERROR、TIME_LIMIT_EXCEEDED、COMPILATION_ERROR、SYSTEM_ERROR
     */
    starjudge::status status = starjudge::status::SYSTEM_ERROR;

    std::string message;

    /**
     * @brief 程序的原始标准输出，超时或运行时错误时为已经输出的部分
     */
    std::string output;

    std::optional<std::string> expected;

    long long time_ms = 0;

    bool cached = false;
};

/**
 * @brief 批量运行样例时单个输入的结果
 */
struct batch_item {
    std::size_t index = 0;
    starjudge::status status = starjudge::status::OK;
    std::string message;
    std::string output;
    long long time_ms = 0;
};

/**
 * @brief 批量运行样例的结果
 * 遇到第一个没有正常结束的输入后停止运行，因此 results 可能比输入少
 */
struct batch_result {
    starjudge::status status = starjudge::status::SYSTEM_ERROR;
    std::string message;
    std::vector<batch_item> results;
    bool cached = false;
};

}  // namespace starjudge
