#pragma once

#include <filesystem>
#include <string>

namespace starjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw internal_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 截取字符串的前 limit 个字节，且不会截断 UTF-8 多字节字符
 */
std::string utf8_truncate(const std::string &string, std::size_t limit);

}  // namespace starjudge
