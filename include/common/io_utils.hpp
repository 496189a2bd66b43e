#pragma once

#include <filesystem>
#include <string>

namespace dcx {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 原样写入文件，文件已存在时覆盖
 * @throw internal_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个不含目录的文件名
 * 语言配置中的源文件名会被拼接到工作目录下，这里确保不会出现目录遍历。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归复制目录 from 中的全部内容到新建的目录 to 中
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * @brief 删除目录，失败时只记录日志
 * 用于清理路径，不能因为删除失败而中断评测流程
 */
void remove_directory_quietly(const std::filesystem::path &dir);

}  // namespace dcx
