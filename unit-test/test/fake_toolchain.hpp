#pragma once

#include <filesystem>
#include <string>
#include "codeeval/config.hpp"

namespace codeeval::test {

/**
 * @brief 用 shell 脚本模拟 javac 和 java，使得引擎测试不依赖 JDK
 * 假编译器：源代码中含有 COMPILE_ERROR 时，以 javac 的格式报告该行的错误并返回 1；
 *          含有 COMPILE_HANG 时永远不结束；否则什么也不做。
 * 假运行时：将入口源文件当作 shell 脚本执行。
 */
struct fake_toolchain {
    fake_toolchain();
    ~fake_toolchain();

    /**
     * @brief 使用假工具链的配置，工作目录位于本对象的临时目录中
     */
    engine_config make_config() const;

    std::filesystem::path workspace_root() const;

    std::filesystem::path dir;
};

/**
 * @brief 创建一个唯一的临时目录
 */
std::filesystem::path make_temp_directory(const std::string &prefix);

/**
 * @brief 目录中的项目数，目录不存在时返回 0
 */
std::size_t count_entries(const std::filesystem::path &dir);

}  // namespace codeeval::test
