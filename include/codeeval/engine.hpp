#pragma once

#include <string>
#include "codeeval/compiler.hpp"
#include "codeeval/config.hpp"
#include "codeeval/result.hpp"
#include "codeeval/runtime.hpp"
#include "codeeval/workspace.hpp"

namespace codeeval {

/**
 * @brief 表示一个选手提交
 */
struct submission {
    /**
     * @param source_text 选手代码，不能为空
     * @param submitter_id 提交者，只用于日志，评测引擎不解析它
     * @throw std::invalid_argument source_text 为空
     */
    explicit submission(const std::string &source_text, const std::string &submitter_id = "");

    const std::string source_text;
    const std::string submitter_id;
};

/**
 * @brief 代码编译与执行引擎
 * 一次评测的流程：
 * 1. 创建工作目录，写入源代码
 * 2. 调用编译器，编译失败时解析编译错误，返回 compilation_error
 * 3. 在时间限制内运行程序，超时返回 timeout
 * 4. 返回码为 0 时返回 success，否则解析异常调用栈，返回 runtime_error
 * 5. 无论从哪里退出，删除工作目录
 * 
 * engine 构造后不再改变，evaluate 可以在多个线程中同时调用，
 * 每次评测使用独立的工作目录，互不影响。
 */
struct engine {
    /**
     * @throw std::invalid_argument 配置不可用
     */
    explicit engine(const engine_config &config);

    /**
     * @brief 编译并运行 source_text
     * 选手代码的问题（编译错误、运行时错误、超时）都通过返回值表示。
     * @throw workspace_error 无法创建工作目录
     * @throw spawn_error 无法启动编译器或运行时
     * @throw termination_error 无法终止超时的程序
     * @throw internal_error 其他系统调用失败
     */
    execution_result evaluate(const std::string &source_text) const;

    execution_result evaluate(const submission &submit) const;

    const engine_config &config() const;

private:
    execution_result evaluate_in(const workspace &ws) const;

    engine_config cfg;
    workspace_manager workspaces;
    compiler_invoker compiler;
    runtime_supervisor supervisor;
};

}  // namespace codeeval
