#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

/**
 * 这个头文件包含评测引擎唯一的输出 execution_result
 * execution_result 是以下四种结果之一：
 * 1. success: 编译通过且程序返回 0
 * 2. compilation_error: 编译器返回非 0
 * 3. runtime_error: 程序返回非 0 或者因为信号崩溃
 * 4. timeout: 程序（或编译器）超出时钟时间限制
 * 评测引擎自身的错误不会出现在这里，而是以 engine_exception 抛出。
 */
namespace codeeval {

/**
 * @brief 表示提交的评测结果
 */
enum class status {
    /**
     * @brief 编译通过，程序在时间限制内运行结束且返回 0
     */
    SUCCESS = 0,

    /**
     * @brief 选手程序无法通过编译
     */
    COMPILATION_ERROR = 1,

    /**
     * @brief 选手程序返回非 0，一般是抛出了未捕获的异常
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 选手程序运行时间超出限制，已被强制终止
     */
    TIMEOUT = 3
};

const char *get_display_message(status);

struct success {
    /**
     * @brief 程序的标准输出，去掉了一个末尾换行
     */
    std::string stdout_output;
};

struct compilation_error {
    std::string raw_message;
    std::optional<int> line_number;
};

struct runtime_error {
    /**
     * @brief 完整的 stderr，为空时是描述返回码或信号的消息
     */
    std::string raw_message;

    /**
     * @brief 异常所在的那一行，没有识别到异常时与 raw_message 相同
     */
    std::string summary;

    std::optional<std::string> exception_type;
    std::optional<int> line_number;

    /**
     * @brief 崩溃前程序已经输出的内容，没有输出时为空
     */
    std::optional<std::string> partial_output;
};

struct timeout {
    std::string raw_message;
};

using execution_result = std::variant<success, compilation_error, runtime_error, timeout>;

status get_status(const execution_result &result);

/**
 * @brief 去掉一个末尾的换行（"\n" 或 "\r\n"），这是唯一的输出规范化规则
 */
std::string strip_trailing_newline(const std::string &text);

void to_json(nlohmann::json &j, const success &result);
void to_json(nlohmann::json &j, const compilation_error &result);
void to_json(nlohmann::json &j, const runtime_error &result);
void to_json(nlohmann::json &j, const timeout &result);

/**
 * @brief 评测结果的 JSON 表示
 * @code{.json}
 * {"status": "Success", "error_message": null, "output": "Hello!"}
 * {"status": "CompilationError", "error_message": "Main.java:3: error: ';' expected ...", "line_number": 3, "output": null}
 * {"status": "RuntimeError", "error_message": "Exception in thread ...", "raw_message": "...",
 *  "exception_type": "ArithmeticException", "line_number": 4, "output": null}
 * {"status": "Timeout", "error_message": "Execution time exceeded limit", "output": null}
 * @endcode
 */
nlohmann::json to_json(const execution_result &result);

}  // namespace codeeval
