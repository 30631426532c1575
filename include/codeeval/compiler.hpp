#pragma once

#include <optional>
#include <string>
#include "codeeval/config.hpp"
#include "codeeval/workspace.hpp"

namespace codeeval {

struct compile_outcome {
    /**
     * @brief 编译是否成功，只取决于编译器的返回码是否为 0
     */
    bool ok = false;

    /**
     * @brief 编译器是否超出时间限制
     */
    bool timed_out = false;

    std::string output;
    std::string error;
    std::optional<int> exit_code;

    /**
     * @brief 编译器的诊断信息，stderr 为空时使用 stdout
     */
    std::string diagnostics() const;
};

/**
 * @brief 调用编译器编译工作目录中的入口源文件
 * 编译命令为 <compiler> <compiler_flags...> -d <workspace> <entry_file>，
 * 编译产物只会输出到工作目录中，不会与并发的评测混淆。
 */
struct compiler_invoker {
    explicit compiler_invoker(const engine_config &config);

    /**
     * @brief 编译工作目录中的源文件
     * @throw spawn_error 编译器不存在或不可执行
     * @throw termination_error 编译超时后无法终止编译器
     */
    compile_outcome compile(const workspace &ws) const;

private:
    toolchain_config toolchain;
    std::chrono::milliseconds time_limit;
    std::chrono::milliseconds kill_grace;
};

}  // namespace codeeval
