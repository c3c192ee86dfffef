#pragma once

#include <boost/stacktrace.hpp>
#include <filesystem>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace starjudge {

/**
 * @brief 评测引擎内部异常的基类，构造时记录调用栈
 * 这类异常不会穿过 judge_engine 的公开接口，而是在那里被记录日志并转换为 Judge Error
 */
struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是工作目录无法创建、源代码无法写入磁盘等文件系统问题
 */
struct internal_error : public judge_exception {
    internal_error();
    internal_error(const std::string &message, const std::filesystem::path &path, std::error_code ec = {});

    /**
     * @brief 出错的文件或目录
     */
    const std::filesystem::path &get_path() const;

private:
    std::filesystem::path path;
};

/**
 * @brief 表示无法创建或者等待子进程
 * 仅在 fork、pipe 这类系统调用失败时抛出，找不到编译器等情况不会抛出这个异常
 */
struct process_error : public judge_exception {
    process_error();
    explicit process_error(const std::string &message);
};

}  // namespace starjudge
