#pragma once

#include <optional>
#include <string>

/**
 * 这个头文件包含从编译器和运行时的输出中提取行号和异常类型的函数
 * 这些函数都是纯函数，不会抛出异常：无法识别的输出会退化为
 * "消息为原始文本，没有行号"。
 * 选手程序可以输出任意长的行，因此只做线性扫描，不使用回溯的正则表达式。
 */
namespace codeeval {

struct compile_diagnostic {
    std::string message;

    /**
     * @brief 第一个错误所在的行号，无法识别时为空
     */
    std::optional<int> line_number;
};

struct runtime_diagnostic {
    /**
     * @brief 识别到异常时为异常所在的那一行（比如
     * Exception in thread "main" java.lang.ArithmeticException: / by zero），
     * 否则为完整的原始文本
     */
    std::string message;

    /**
     * @brief 异常的类名（不含包名），比如 ArithmeticException
     */
    std::optional<std::string> exception_type;

    /**
     * @brief 调用栈中第一个位于入口源文件的行号
     */
    std::optional<int> line_number;
};

/**
 * @brief 解析编译器的错误输出
 * 错误格式为 <file>:<line>: error: <message>，只返回第一个错误的行号，
 * 引导选手逐个修复错误。
 * @param raw_text 编译器的输出
 * @param entry_file_name 入口源文件名，比如 Main.java
 */
compile_diagnostic parse_compile_error(const std::string &raw_text, const std::string &entry_file_name) noexcept;

/**
 * @brief 解析运行时的异常调用栈
 * @code
 * Exception in thread "main" java.lang.ArithmeticException: / by zero
 *     at Main.main(Main.java:4)
 * @endcode
 * 将得到 exception_type = "ArithmeticException", line_number = 4
 * @param raw_text 运行时的 stderr 输出
 * @param entry_file_name 入口源文件名，比如 Main.java
 */
runtime_diagnostic parse_runtime_error(const std::string &raw_text, const std::string &entry_file_name) noexcept;

}  // namespace codeeval
