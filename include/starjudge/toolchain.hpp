#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含编译器、解释器的查找逻辑
 * 每个工具都有一张按顺序尝试的查找策略表：
 * 1. 环境变量显式指定（比如 GPP_PATH）
 * 2. 安装目录下的约定位置（比如 JAVA_HOME/bin，/usr/lib/jvm/ * /bin）
 * 3. 都找不到时返回命令名本身，交给 PATH 查找
 * 查找过程只读文件系统，不会产生副作用。
 */
namespace starjudge {

enum class tool {
    GPP,
    JAVAC,
    JAVA,
    PYTHON
};

const char *get_tool_name(tool);

/**
 * @brief 查找工具时对外部环境的访问
 * 单元测试可以替换这些函数，从而不需要访问真实的文件系统
 */
struct toolchain_probe {
    /**
     * @brief 读取环境变量，不存在或为空时返回 nullopt
     */
    std::function<std::optional<std::string>(const std::string &)> getenv;

    /**
     * @brief 判断路径是否为可执行的普通文件
     */
    std::function<bool(const std::filesystem::path &)> is_executable;

    /**
     * @brief 列出文件夹内的所有子文件夹，按名称排序，文件夹不存在时返回空列表
     */
    std::function<std::vector<std::filesystem::path>(const std::filesystem::path &)> list_directories;

    /**
     * @brief 访问真实环境变量和文件系统的实现
     */
    static toolchain_probe system();
};

/**
 * @brief 一个查找策略，找到时返回工具路径
 */
using toolchain_resolver = std::function<std::optional<std::filesystem::path>(const toolchain_probe &)>;

/**
 * @brief 环境变量直接指定了工具路径
 * 显式配置总是优先，即使文件不存在也会返回，以便启动失败时能看到配置的路径
 */
toolchain_resolver from_env(const std::string &var);

/**
 * @brief 环境变量指定了安装目录，工具位于 $var/relative
 */
toolchain_resolver from_env_home(const std::string &var, const std::filesystem::path &relative);

/**
 * @brief 在若干个固定的安装目录中查找名为 name 的可执行文件
 */
toolchain_resolver from_install_roots(const std::vector<std::filesystem::path> &roots, const std::string &name);

/**
 * @brief 在 parent 的每个子文件夹中查找 relative，比如 /usr/lib/jvm/ * /bin/java
 */
toolchain_resolver from_subdirectories(const std::filesystem::path &parent, const std::filesystem::path &relative);

/**
 * @brief 一个工具的查找结果
 */
struct toolchain_resolution {
    std::filesystem::path path;

    /**
     * @brief 查找结果来自哪个策略
     * 可能的值为 env, install-root, fallback
     */
    std::string source;
};

struct toolchain_strategy {
    /**
     * @brief 所有策略都失败时使用的命令名，由 execvp 在 PATH 中查找
     */
    std::string command;

    /**
     * @brief 按顺序尝试的策略，first 为策略的来源名称
     */
    std::vector<std::pair<std::string, toolchain_resolver>> resolvers;
};

/**
 * @brief 编译器、解释器的查找器
 * 这个类是无状态的，可以被多个线程同时使用
 */
struct toolchain_locator {
    explicit toolchain_locator(toolchain_probe probe = toolchain_probe::system());

    /**
     * @brief 查找工具，并返回查找结果来自哪个策略
     */
    toolchain_resolution resolve(tool t) const;

    /**
     * @brief 查找工具，找不到时返回命令名本身
     */
    std::filesystem::path find(tool t) const;

    /**
     * @brief 所有工具的查找结果，供诊断使用
     */
    std::vector<std::pair<tool, toolchain_resolution>> report() const;

private:
    toolchain_probe probe;
    std::map<tool, toolchain_strategy> strategies;
};

}  // namespace starjudge
