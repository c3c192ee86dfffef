#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "starjudge/judge/verdict.hpp"
#include "starjudge/process.hpp"

namespace starjudge {

/**
 * @brief 规范化程序输出
 * 将 \r\n 和单独的 \r 替换为 \n，删除每行末尾的空白字符，删除文末的空行
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 规范化后两个输出是否完全一致
 */
bool outputs_match(const std::string &actual, const std::string &expected);

/**
 * @brief 将错误信息截断到 MESSAGE_LIMIT 字节
 */
std::string truncate_message(const std::string &message);

/**
 * @brief 根据程序的运行结果判断一个测试点的评测结果
 * 超时优先于运行时错误，运行时错误优先于答案错误
 */
case_verdict classify_case(std::size_t index, const execution_outcome &outcome, const std::string &expected_output);

/**
 * @brief 按优先级汇总测试点的评测结果，没有测试点时为 ACCEPTED
 */
status aggregate_status(const std::vector<case_verdict> &results);

/**
 * @brief 通过测试点的百分比，四舍五入；没有测试点时为 0
 */
int compute_score(const std::vector<case_verdict> &results);

}  // namespace starjudge
