#pragma once

#include <filesystem>
#include <string>

namespace codeeval {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 原样写入文件（二进制模式，不做换行转换）
 * @throw std::system_error 打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言文件名不包含目录分隔符和返回上一层目录的情况
 * 入口类名会拼接到工作目录里成为源文件名，因此不允许出现 "/" 和 ".."，
 * 否则源代码可能被写到工作目录以外。
 * @param name 被检查的文件名
 * @return name 本身
 * @throw std::invalid_argument name 不安全
 */
std::string assert_safe_file_name(const std::string &name);

/**
 * @brief 删除整个目录树，失败时返回错误码而不是抛出异常
 * @return 删除失败时的错误码，成功时为空
 */
std::error_code remove_directory_tree(const std::filesystem::path &dir) noexcept;

}  // namespace codeeval
