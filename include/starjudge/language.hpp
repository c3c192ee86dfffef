#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "starjudge/toolchain.hpp"

namespace starjudge {

/**
 * @brief 评测系统支持的编程语言
 */
enum class language {
    CPP,
    PYTHON,
    JAVA
};

/**
 * @brief 根据语言名查找语言
 * 接受 "C++"、"Python"、"Java"，以及小写别名 "cpp"、"python"、"java"
 * @return 不支持的语言返回 nullopt
 */
std::optional<language> parse_language(const std::string &name);

/**
 * @brief 语言的显示名称，比如 "C++"
 */
const char *get_language_name(language lang);

/**
 * @brief 表示一个外部命令
 */
struct command {
    std::filesystem::path executable;
    std::vector<std::string> args;
};

/**
 * @brief 一种语言在工作目录中的文件布局和编译运行方式
 */
struct language_profile {
    language lang;

    /**
     * @brief 源文件名
     * Java 的公共类名必须和文件名一致，因此固定为 Main.java
     */
    std::string source_file;

    /**
     * @brief 编译产物的文件名，也是编译缓存保存的文件
     * 对于不需要编译的语言，为空
     */
    std::string artifact_file;

    /**
     * @brief 编译产物在缓存目录中的扩展名
     */
    std::string cache_extension;

    /**
     * @brief 编译命令，在工作目录中执行
     * 对于不需要编译的语言，返回 nullopt
     */
    std::optional<command> compile_command(const toolchain_locator &toolchain, const std::filesystem::path &workdir) const;

    /**
     * @brief 运行命令，在工作目录中执行
     */
    command run_command(const toolchain_locator &toolchain, const std::filesystem::path &workdir) const;

    bool compiled() const;
};

const language_profile &get_language_profile(language lang);

}  // namespace starjudge
