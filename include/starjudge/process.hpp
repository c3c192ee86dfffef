#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace starjudge {

/**
 * @brief 子进程的运行结果
 */
struct execution_outcome {
    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 子进程的返回值
     * 被信号杀死时为 128 + 信号编号，无法启动时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 子进程是否因为超时被杀死
     */
    bool timed_out = false;

    /**
     * @brief 子进程的运行时钟时间，单位为毫秒
     */
    long long duration_ms = 0;
};

struct run_options {
    /**
     * @brief 子进程的工作目录，为空时继承当前进程的工作目录
     */
    std::filesystem::path cwd;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string input;

    /**
     * @brief 时钟时间限制，超时后子进程所在的进程组会被 SIGKILL 杀死
     */
    std::chrono::milliseconds timeout{1500};

    /**
     * @brief 在继承的环境变量基础上新增或覆盖的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief stdout 和 stderr 各自最多保存的字节数，超出部分被读取后丢弃
     */
    std::size_t output_limit;

    run_options();
};

/**
 * @brief 运行外部程序并等待其结束
 *
 * 子进程位于独立的进程组中，超时后整个进程组被杀死，已经读到的输出仍然返回。
 * 写入标准输入与读取标准输出、标准错误在同一个循环中交替进行，因此大量输入输出不会死锁。
 *
 * 找不到可执行文件、没有执行权限、工作目录不存在时不抛出异常，
 * 而是返回 exit_code 为 -1 且 stderr_data 为错误原因的结果。
 *
 * @param executable 可执行文件路径，不含 '/' 时在 PATH 中查找
 * @param args 命令行参数，不包括 argv[0]
 * @throw process_error 若 pipe、fork、poll 等系统调用失败
 */
execution_outcome run_process(const std::filesystem::path &executable, const std::vector<std::string> &args, const run_options &options);

}  // namespace starjudge
