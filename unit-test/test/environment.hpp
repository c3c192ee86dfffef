#pragma once

#include <filesystem>
#include <string>
#include "starjudge/toolchain.hpp"

/**
 * 测试用的评测环境
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()
 * 2. 需要真实编译器的测试先用 toolchain_available 检查，不存在时跳过
 */
namespace starjudge::test {

/**
 * @brief 将 WORK_DIR 和 CACHE_DIR 指向 /tmp/starjudge-test 下的目录
 * 评测时间限制放宽到测试机器也能稳定通过的值
 */
void setup_test_environment();

/**
 * @brief 创建一个随机命名的空目录
 */
std::filesystem::path make_temp_directory(const std::string &prefix);

/**
 * @brief 工具是否能被找到并且可以执行
 */
bool toolchain_available(tool t);

}  // namespace starjudge::test
