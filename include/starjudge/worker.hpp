#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include "starjudge/common/concurrent_queue.hpp"
#include "starjudge/judge/engine.hpp"

/**
 * 评测服务相关函数
 * 主线程从标准输入（或者请求文件）逐行读取 JSON 请求并放入请求队列，
 * 多个 worker 线程从队列中取出请求，使用同一个评测引擎评测，并通过 writer 输出响应。
 * 所有 worker 共享同一个编译缓存，因此相同的代码只会被编译一次。
 */
namespace starjudge {

/**
 * @brief 输出一个响应，多个 worker 可能同时调用
 */
using response_writer = std::function<void(const nlohmann::json &)>;

/**
 * @brief 处理一个 JSON 请求
 * 检查代码和输入数据的长度，然后根据请求类型调用评测引擎。
 * 请求格式不正确时返回 Judge Error，不会抛出异常。
 * @return 响应，包含请求的 id
 */
nlohmann::json handle_request(judge_engine &engine, const nlohmann::json &request);

/**
 * @brief 解析并处理一行 JSON 请求
 */
nlohmann::json handle_request_line(judge_engine &engine, const std::string &line);

/**
 * @brief 启动评测 worker 线程
 * worker 在请求队列关闭且为空后退出
 * @param worker_id worker 的编号，仅用于日志
 * @param task_queue 请求队列，每个元素为一行 JSON
 * @param writer 输出响应
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, judge_engine &engine, concurrent_queue<std::string> &task_queue, response_writer writer);

}  // namespace starjudge
