#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codeeval {

/**
 * @brief 命令行程序的返回码
 */
enum exit_codes {
    E_SUCCESS = 0,
    E_USAGE_ERROR = 1,
    E_INTERNAL_ERROR = 2
};

/**
 * @brief 工具链的配置
 * 默认为 JDK：编译命令为
 *     <compiler> <compiler_flags...> -d <workspace> <workspace>/<entry_point><source_extension>
 * 运行命令为
 *     <runtime> <runtime_flags...> -cp <workspace> <entry_point>
 * 测试时可以替换为假的工具链（比如 shell 脚本），只要接受同样的参数即可。
 */
struct toolchain_config {
    /**
     * @brief 编译器路径，不含 "/" 时从 PATH 中查找
     */
    std::filesystem::path compiler = "javac";

    /**
     * @brief 运行时路径，不含 "/" 时从 PATH 中查找
     */
    std::filesystem::path runtime = "java";

    /**
     * @brief 额外传给编译器的参数，比如 -encoding UTF-8
     */
    std::vector<std::string> compiler_flags;

    /**
     * @brief 额外传给运行时的参数，比如 -Xmx256m
     */
    std::vector<std::string> runtime_flags;

    /**
     * @brief 应用程序入口
     * 对于 Java，entry_point 为应用程序主类，源文件名必须与之一致
     */
    std::string entry_point = "Main";

    std::string source_extension = ".java";

    /**
     * @brief 入口源文件名，比如 Main.java
     */
    std::string entry_file_name() const;
};

/**
 * @brief 评测引擎的配置，构造引擎后不再改变
 */
struct engine_config {
    toolchain_config toolchain;

    /**
     * @brief 存放所有工作目录的根目录
     * WORKSPACE_ROOT
     * ├── 1b4e28ba-2fa1-11d2-883f-0016d3cca427 // 随机生成的 uuid，每次评测一个
     * │   ├── Main.java // 选手代码
     * │   └── Main.class // 编译产物
     * └── ...
     */
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "codeeval";

    /**
     * @brief 选手程序运行的时钟时间限制
     */
    std::chrono::milliseconds time_limit{5000};

    /**
     * @brief 编译器运行的时钟时间限制
     */
    std::chrono::milliseconds compile_time_limit{10000};

    /**
     * @brief 超时后发送 SIGTERM 与 SIGKILL 之间的等待时间
     */
    std::chrono::milliseconds kill_grace{100};

    /**
     * @brief 是否保留工作目录
     * 开启后评测结束不会删除工作目录，以便手动检查产生的文件。
     */
    bool keep_workspace = false;
};

/**
 * @brief 从 JSON 配置文件读取引擎配置
 * 所有键都是可选的，未出现的键保留默认值
 * @code{.json}
 * {
 *     "compiler": "/usr/lib/jvm/java-17/bin/javac",
 *     "runtime": "/usr/lib/jvm/java-17/bin/java",
 *     "compiler_flags": ["-encoding", "UTF-8"],
 *     "runtime_flags": ["-Xmx256m"],
 *     "entry_point": "Main",
 *     "source_extension": ".java",
 *     "workspace_dir": "/tmp/codeeval",
 *     "time_limit_ms": 5000,
 *     "compile_time_limit_ms": 10000,
 *     "kill_grace_ms": 100,
 *     "debug": false
 * }
 * @endcode
 * @throw std::invalid_argument 键的类型不正确或者文件不是合法的 JSON
 */
engine_config load_config(const std::filesystem::path &path);

/**
 * @brief 用 JSON 文本覆盖配置中出现的键
 */
void merge_config(engine_config &config, const std::string &json_text);

/**
 * @brief 用环境变量覆盖配置
 * CODEEVAL_COMPILER, CODEEVAL_RUNTIME, CODEEVAL_WORKSPACE_DIR, CODEEVAL_TIME_LIMIT（毫秒）, DEBUG
 */
void apply_environment(engine_config &config);

/**
 * @brief 命令行程序使用的配置：默认值，被配置文件覆盖，再被环境变量覆盖
 * @param config_file 配置文件，为空时不读取
 * @throw std::invalid_argument 配置文件不可用、环境变量不正确或者找不到临时目录
 */
engine_config load_engine_config(const std::optional<std::filesystem::path> &config_file);

/**
 * @brief 检查配置是否可用
 * @throw std::invalid_argument 入口类名不安全，或者时间限制不在 (0, 24h] 内
 */
void validate_config(const engine_config &config);

}  // namespace codeeval
