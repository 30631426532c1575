#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codeeval {

/**
 * @brief 评测引擎自身的错误（而不是选手代码的错误）
 * 选手代码的编译错误、运行时错误、超时都通过 execution_result 返回，
 * 只有引擎运行环境出现问题时才会抛出 engine_exception 及其子类。
 */
struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    /**
     * @brief 输出错误信息及构造异常时的调用栈，仅用于日志
     */
    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的内部错误
 */
struct internal_error : public engine_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法创建或写入工作目录，通常是文件系统的问题
 */
struct workspace_error : public engine_exception {
    workspace_error();
    explicit workspace_error(const std::string &message);
};

/**
 * @brief 表示无法启动编译器或运行时进程
 * 一般是工具链没有安装，或者配置的路径不可执行
 */
struct spawn_error : public engine_exception {
    spawn_error();
    explicit spawn_error(const std::string &message);
};

/**
 * @brief 表示无法终止超时的进程组
 * 进程失控是资源安全问题，必须上报给调用方
 */
struct termination_error : public engine_exception {
    termination_error();
    explicit termination_error(const std::string &message);
};

}  // namespace codeeval
