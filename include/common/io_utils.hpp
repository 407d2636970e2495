#pragma once

#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::runtime_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 检查文件夹是否存在且当前用户可写
 */
bool is_writable_directory(const std::filesystem::path &dir);

}  // namespace codejudge
