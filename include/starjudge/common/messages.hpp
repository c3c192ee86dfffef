#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "starjudge/judge/verdict.hpp"

/**
 * 命令行前端使用的 JSON 消息格式
 * 请求：{"type": "judge"|"run"|"batch", "id": ..., "language": "C++", "code": "...", ...}
 * 响应：评测结果对象，字段名为驼峰式（timeMs），并原样返回请求的 id
 */
namespace starjudge::message {

enum class request_type {
    /**
     * @brief 评测一份代码，需要 testcases
     */
    JUDGE,

    /**
     * @brief 运行单个样例，需要 input，可选 expected
     */
    RUN,

    /**
     * @brief 批量运行样例，需要 inputs
     */
    BATCH
};

struct request {
    request_type type = request_type::JUDGE;

    /**
     * @brief 调用者指定的请求标识，可以是任意 JSON 值，原样写回响应
     */
    nlohmann::json id;

    std::string language;
    std::string code;

    std::vector<test_case> testcases;

    std::string input;
    std::optional<std::string> expected;

    std::vector<std::string> inputs;
};

/**
 * @throw std::invalid_argument 若缺少必要字段、字段类型不正确或者请求类型未知
 */
void from_json(const nlohmann::json &j, request &req);

/**
 * @brief 构造 Judge Error 响应
 */
nlohmann::json error_response(const std::string &message, const nlohmann::json &id = nullptr);

}  // namespace starjudge::message

namespace starjudge {

void to_json(nlohmann::json &j, const case_verdict &verdict);
void to_json(nlohmann::json &j, const judge_verdict &verdict);
void to_json(nlohmann::json &j, const sample_result &result);
void to_json(nlohmann::json &j, const batch_item &item);
void to_json(nlohmann::json &j, const batch_result &result);

}  // namespace starjudge
