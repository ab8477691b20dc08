#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法打开或者写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会逃出所在的文件夹
 * 工作文件夹内的文件名来自语言配置，这里确保拼接路径时
 * 不会出现 "../" 或者绝对路径导致写到工作文件夹外面。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 查找文件夹内有多少个子文件夹（不递归统计）
 * @param dir 要被统计的文件夹
 * @return 文件夹内的子文件夹数量，文件夹不存在时返回 -1
 */
int count_directories_in_directory(const std::filesystem::path &dir);

}  // namespace runner
