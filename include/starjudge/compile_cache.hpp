#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "starjudge/language.hpp"

namespace starjudge {

/**
 * @brief 编译缓存，将 (语言, 源代码) 映射到已经编译好的可执行文件
 *
 * 缓存文件保存在独立的缓存目录中，文件名为 <MD5>.<扩展名>。
 * 缓存项只有在文件仍然存在时才有效，文件被删除后在下次 get 时被移除。
 * 可执行文件不会在缓存目录中直接运行，评测前由调用者复制到工作目录中。
 *
 * 这个类可以被多个线程同时使用。
 */
struct compile_cache {
    /**
     * @param cache_dir 缓存目录，不存在时自动创建；目录中已有的缓存文件会被重新索引
     * @param max_entries 最多保存的缓存项个数，超出时删除最久未使用的缓存项，为 0 表示不限制
     */
    explicit compile_cache(const std::filesystem::path &cache_dir, std::size_t max_entries = 0);

    compile_cache(const compile_cache &) = delete;
    compile_cache &operator=(const compile_cache &) = delete;

    /**
     * @brief 计算缓存键，为 "语言名:源代码" 的 MD5 的十六进制表示
     */
    static std::string hash_key(language lang, const std::string &code);

    /**
     * @brief 查找缓存的可执行文件
     * @return 缓存文件的路径；没有缓存或缓存文件已经被删除时返回 nullopt
     */
    std::optional<std::filesystem::path> get(const std::string &key);

    /**
     * @brief 将编译产物复制到缓存目录
     * 先复制到临时文件，再原子地重命名到最终位置，因此其他线程不会读到未写完的文件。
     * 同一个键被多次写入时，保留最后一次写入的文件。
     * @param artifact 编译产物的路径
     * @param extension 缓存文件的扩展名，比如 exe、class
     * @return 是否写入成功，失败时只记录日志
     */
    bool put(const std::string &key, const std::filesystem::path &artifact, const std::string &extension);

    std::size_t size() const;
    std::size_t hits() const;
    std::size_t misses() const;

private:
    struct entry {
        std::filesystem::path path;
        unsigned long long access_time;
    };

    void touch(const std::string &key);
    void shrink();

    std::filesystem::path cache_dir;
    std::size_t max_entries;

    mutable std::mutex mut;
    std::unordered_map<std::string, entry> entries;

    /**
     * @brief 访问时间到缓存键的映射，begin() 为最久未使用的缓存项
     */
    std::map<unsigned long long, std::string> sorted_entries;
    unsigned long long last_access_time = 0;

    std::size_t hit_count = 0, miss_count = 0;
};

}  // namespace starjudge
