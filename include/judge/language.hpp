#pragma once

#include <optional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 描述一种编程语言
 * 编译命令和运行命令仅供外部系统展示，沙箱根据 engine_language 自行决定如何编译运行
 */
struct language {
    int id;

    std::string name;

    std::string version;

    /**
     * @brief 源代码文件扩展名，比如 ".cpp"
     */
    std::string extension;

    /**
     * @brief 编译命令模板，解释型语言没有编译命令
     */
    std::optional<std::string> compile_command;

    std::string run_command;

    /**
     * @brief 传给沙箱 --language 参数的语言名
     */
    std::string engine_language;
};

/**
 * @brief 根据语言 id 查找语言
 * @return 语言表中的语言，如果不存在则返回 nullptr
 */
const language *find_language(int language_id);

/**
 * @brief 根据语言 id 查找语言
 * @throw unsupported_language 如果语言表中不存在该语言
 */
const language &get_language(int language_id);

/**
 * @brief 语言表中的所有语言，按 id 排序
 */
const std::vector<language> &languages();

}  // namespace codejudge
