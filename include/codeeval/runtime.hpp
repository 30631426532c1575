#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "codeeval/config.hpp"
#include "codeeval/process.hpp"
#include "codeeval/workspace.hpp"

namespace codeeval {

struct run_outcome {
    process_status status = process_status::COMPLETED;
    std::string output;
    std::string error;

    /**
     * @brief 程序的返回码，超时时为空；因信号崩溃时为 128 + 信号值
     */
    std::optional<int> exit_code;

    std::optional<int> signal;

    std::chrono::milliseconds wall_time{0};
};

/**
 * @brief 在工作目录中运行编译好的程序，并强制执行时钟时间限制
 * 运行命令为 <runtime> <runtime_flags...> -cp <workspace> <entry_point>，
 * 超时后整个进程组都会被杀死，run 返回时不会有该程序的任何进程残留。
 */
struct runtime_supervisor {
    explicit runtime_supervisor(const engine_config &config);

    /**
     * @brief 使用配置中的时间限制（默认 5 秒）运行程序
     */
    run_outcome run(const workspace &ws) const;

    /**
     * @brief 运行程序
     * @param ws 编译好的工作目录
     * @param time_limit 时钟时间限制
     * @throw spawn_error 运行时不存在或不可执行
     * @throw termination_error 无法终止超时的进程组
     */
    run_outcome run(const workspace &ws, std::chrono::milliseconds time_limit) const;

private:
    toolchain_config toolchain;
    std::chrono::milliseconds default_time_limit;
    std::chrono::milliseconds kill_grace;
};

}  // namespace codeeval
