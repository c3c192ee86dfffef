#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace starjudge {

/**
 * @brief 根据 key 来查找环境变量
 * @return 环境变量的值，不存在或者为空字符串时返回 nullopt
 */
std::optional<std::string> find_env(const std::string &key);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 构造子进程使用的环境变量列表
 * 在当前进程的环境变量的基础上，用 overrides 覆盖或新增环境变量
 * @return "KEY=VALUE" 格式的字符串列表
 */
std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace starjudge
