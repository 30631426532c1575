#include "codeeval/config.hpp"
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include "codeeval/common/io_utils.hpp"
#include "codeeval/common/utils.hpp"

namespace codeeval {
using namespace std;
namespace fs = std::filesystem;

string toolchain_config::entry_file_name() const {
    return entry_point + source_extension;
}

/**
 * @brief 若 j 中存在 key，将其转换为 T 类型存入 target
 * @throw std::invalid_argument 值的类型与 T 不符
 */
template <typename T>
static bool read_key(const nlohmann::json &j, const char *key, T &target) {
    if (!j.count(key) || j.at(key).is_null()) return false;
    try {
        target = j.at(key).get<T>();
    } catch (nlohmann::json::exception &) {
        throw invalid_argument(string("Unexpected value type of: ") + key + " in " + j.dump(2));
    }
    return true;
}

static chrono::milliseconds parse_milliseconds(const string &key, const string &value) {
    long long ms;
    if (!boost::conversion::try_lexical_convert(value, ms))
        throw invalid_argument(key + " should be a number of milliseconds, got " + value);
    return chrono::milliseconds(ms);
}

void merge_config(engine_config &config, const string &json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (nlohmann::json::parse_error &e) {
        throw invalid_argument(string("malformed configuration: ") + e.what());
    }
    if (!j.is_object())
        throw invalid_argument("configuration should be a JSON object");

    string str;
    if (read_key(j, "compiler", str)) config.toolchain.compiler = str;
    if (read_key(j, "runtime", str)) config.toolchain.runtime = str;
    read_key(j, "compiler_flags", config.toolchain.compiler_flags);
    read_key(j, "runtime_flags", config.toolchain.runtime_flags);
    read_key(j, "entry_point", config.toolchain.entry_point);
    read_key(j, "source_extension", config.toolchain.source_extension);
    if (read_key(j, "workspace_dir", str)) config.workspace_root = str;

    long long ms;
    if (read_key(j, "time_limit_ms", ms)) config.time_limit = chrono::milliseconds(ms);
    if (read_key(j, "compile_time_limit_ms", ms)) config.compile_time_limit = chrono::milliseconds(ms);
    if (read_key(j, "kill_grace_ms", ms)) config.kill_grace = chrono::milliseconds(ms);
    read_key(j, "debug", config.keep_workspace);
}

engine_config load_config(const fs::path &path) {
    if (!fs::is_regular_file(path))
        throw invalid_argument("configuration file " + path.string() + " does not exist");

    engine_config config;
    merge_config(config, read_file_content(path));
    return config;
}

void apply_environment(engine_config &config) {
    if (getenv("CODEEVAL_COMPILER"))
        config.toolchain.compiler = get_env("CODEEVAL_COMPILER", "");
    if (getenv("CODEEVAL_RUNTIME"))
        config.toolchain.runtime = get_env("CODEEVAL_RUNTIME", "");
    if (getenv("CODEEVAL_WORKSPACE_DIR"))
        config.workspace_root = get_env("CODEEVAL_WORKSPACE_DIR", "");
    if (getenv("CODEEVAL_TIME_LIMIT"))
        config.time_limit = parse_milliseconds("CODEEVAL_TIME_LIMIT", get_env("CODEEVAL_TIME_LIMIT", ""));
    if (getenv("DEBUG"))
        config.keep_workspace = true;
}

engine_config load_engine_config(const optional<fs::path> &config_file) {
    optional<engine_config> config;
    try {
        // 默认的工作目录根位于临时目录中，TMPDIR 不是目录时构造配置就会失败
        config = config_file ? load_config(*config_file) : engine_config();
    } catch (fs::filesystem_error &e) {
        throw invalid_argument(string("unable to prepare configuration: ") + e.what());
    }
    apply_environment(*config);
    return *config;
}

// 时间限制不超过 24 小时，否则 steady_clock::now() + time_limit 可能溢出
static const chrono::milliseconds MAX_TIME_LIMIT = chrono::hours(24);

void validate_config(const engine_config &config) {
    assert_safe_file_name(config.toolchain.entry_file_name());
    if (config.toolchain.entry_point.empty())
        throw invalid_argument("entry point should not be empty");
    if (config.toolchain.compiler.empty() || config.toolchain.runtime.empty())
        throw invalid_argument("compiler and runtime should be specified");
    if (config.time_limit.count() <= 0 || config.time_limit > MAX_TIME_LIMIT)
        throw invalid_argument("time limit should be positive and no more than 24 hours");
    if (config.compile_time_limit.count() <= 0 || config.compile_time_limit > MAX_TIME_LIMIT)
        throw invalid_argument("compile time limit should be positive and no more than 24 hours");
    if (config.kill_grace.count() < 0 || config.kill_grace > MAX_TIME_LIMIT)
        throw invalid_argument("kill grace should not be negative or more than 24 hours");
}

}  // namespace codeeval
