#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "starjudge/language.hpp"

namespace starjudge {

/**
 * @brief 一次评测独占的工作目录
 * 析构时递归删除整个目录，删除失败只记录日志。
 * 工作目录位于 WORK_DIR 下，永远不会是编译缓存目录。
 */
struct workspace {
    /**
     * @brief 工作目录
     */
    std::filesystem::path root;

    /**
     * @brief 选手源代码的路径
     */
    std::filesystem::path source_path;

    /**
     * @brief 编译产物的路径，对于 Python 为源代码本身
     */
    std::filesystem::path executable_path;

    const language_profile &profile;

    workspace(const std::filesystem::path &root, const language_profile &profile);
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    /**
     * @brief 删除工作目录，可以重复调用
     */
    void release();

    /**
     * @brief 不在析构时删除工作目录，用于 DEBUG 模式下检查评测产生的文件
     */
    void keep();

private:
    bool released = false;
};

/**
 * @brief 创建工作目录并写入源代码
 * @param work_dir 所有工作目录的根目录，不存在时自动创建
 * @param lang 源代码的语言，决定源文件名
 * @param code 源代码
 * @return 可以立即使用的工作目录
 * @throw internal_error 若目录无法创建或源代码无法写入
 */
std::unique_ptr<workspace> create_workspace(const std::filesystem::path &work_dir, language lang, const std::string &code);

}  // namespace starjudge
