#pragma once

#include <cstddef>
#include <filesystem>

namespace starjudge {

/**
 * @brief 编译器的时钟时间限制
 * 单位为毫秒，远大于单个测试点的运行时间限制
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 单个测试点（以及预热运行）的时钟时间限制
 * 单位为毫秒
 */
extern int RUN_TIME_LIMIT;

/**
 * @brief 编译错误、运行时错误、评测错误信息的最大长度
 * 单位为字节，超出部分被截断
 */
extern std::size_t MESSAGE_LIMIT;

/**
 * @brief 子进程 stdout/stderr 各自最多保存多少字节，超出部分被丢弃
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 代码长度上限，由调用方（请求解析）检查
 * 单位为字节
 */
extern std::size_t MAX_CODE_LENGTH;

/**
 * @brief 单个输入数据长度上限，由调用方（请求解析）检查
 * 单位为字节
 */
extern std::size_t MAX_INPUT_LENGTH;

/**
 * @brief 编译缓存最多保存多少个可执行文件
 * 为 0 表示不限制
 */
extern std::size_t CACHE_MAX_ENTRIES;

/**
 * @brief 选手程序编译及运行的根目录
 * 每次评测都会在这里创建一个随机命名的工作目录，评测结束后删除
 *
 * WORK_DIR
 * ├── run-6f1c... // 一次评测的工作目录
 * │   ├── main.cpp // 选手程序代码（Java 为 Main.java，Python 为 main.py）
 * │   └── main // 编译生成的可执行文件（Java 为 Main.class）
 * ├── run-...
 * └── cache // 默认的 CACHE_DIR
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 编译缓存目录，和任何工作目录都不重叠
 * 删除这个文件夹只会导致重新编译，不会影响评测结果
 *
 * CACHE_DIR
 * ├── 0cc175b9c0f1b6a831c399e269772661.exe // C++ 可执行文件
 * └── 92eb5ffee6ae2fec3ad71c777531578f.class // Java 字节码
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统不会删除评测的工作目录，以便手动检查。
 */
extern bool DEBUG;

/**
 * @brief 默认的工作目录，为系统临时文件夹下的 starstack-oj
 */
std::filesystem::path default_work_dir();

}  // namespace starjudge
