#pragma once

#include <optional>
#include <string>

namespace starjudge {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 枚举值的前四项同时也是汇总评测结果时的优先级，数值越大越严重
 */
enum class status {
    /**
     * @brief 用户程序本测试点评测通过
     * 正常退出，且忽略行末空白字符和文末空行后输出与标准输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 用户程序正常退出，但输出与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序出现运行时错误
     * 用户程序的返回值非 0，或者因为信号而崩溃
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间，超时后用户程序所在的进程组会被强制杀死
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序编译错误
     * 编译器返回值非 0，或者编译超时
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 评测系统出错
     * 不支持的语言、没有测试数据、评测过程中的内部异常
     */
    SYSTEM_ERROR = 5,

    /**
     * @brief 程序正常运行结束
     * 仅用于样例运行，表示没有标准输出可以比较
     */
    OK = 6
};

/**
 * @brief 获得评测结果的显示名称，比如 "Accepted"、"Compile Error"
 */
const char *get_display_message(status);

/**
 * @brief 根据显示名称查找评测结果
 * @return 若名称不存在，返回 nullopt
 */
std::optional<status> parse_status(const std::string &name);

/**
 * @brief 汇总多个测试点的评测结果时使用的优先级
 * ACCEPTED < WRONG_ANSWER < RUNTIME_ERROR < TIME_LIMIT_EXCEEDED，其他结果排在最后
 */
int get_priority(status);

/**
 * @brief 返回两个评测结果中更严重的一个，相同优先级时保留 current
 */
status worse_status(status current, status candidate);

}  // namespace starjudge
