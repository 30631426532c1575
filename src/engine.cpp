#include "codeeval/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include <system_error>
#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/utils.hpp"
#include "codeeval/diagnostics.hpp"

namespace codeeval {
using namespace std;

submission::submission(const string &source_text, const string &submitter_id)
    : source_text(source_text), submitter_id(submitter_id) {
    if (source_text.empty())
        throw invalid_argument("source text should not be empty");
}

/**
 * @brief 去掉诊断信息中的工作目录路径
 * 工作目录名是随机的 uuid，去掉后同一份代码的诊断信息可以复现，也不会泄露服务器的目录结构
 */
static string hide_workspace(const string &text, const workspace &ws) {
    string root = ws.root_path.string();
    string hidden = boost::algorithm::replace_all_copy(text, root + "/", "");
    boost::algorithm::replace_all(hidden, root, ".");
    return hidden;
}

static string describe_exit(const run_outcome &run) {
    if (run.signal)
        return fmt::format("Process terminated by signal {} ({})", *run.signal, strsignal(*run.signal));
    else if (run.exit_code)
        return fmt::format("Process exited with code {}", *run.exit_code);
    else
        return "Runtime error";
}

static engine_config validated(const engine_config &config) {
    validate_config(config);
    return config;
}

engine::engine(const engine_config &config)
    : cfg(validated(config)), workspaces(cfg), compiler(cfg), supervisor(cfg) {}

const engine_config &engine::config() const {
    return cfg;
}

execution_result engine::evaluate(const string &source_text) const {
    return evaluate(submission(source_text));
}

execution_result engine::evaluate(const submission &submit) const {
    elapsed_time timer;
    try {
        scoped_workspace ws(workspaces, submit.source_text);
        LOG(INFO) << "evaluating submission" << (submit.submitter_id.empty() ? "" : " of " + submit.submitter_id)
                  << " in " << ws->root_path;

        execution_result result = evaluate_in(ws.get());

        LOG(INFO) << fmt::format("submission evaluated: {} ({} ms)",
                                 get_display_message(get_status(result)),
                                 timer.duration<chrono::milliseconds>().count());
        return result;
    } catch (engine_exception &e) {
        LOG(ERROR) << "engine failure: " << e;
        throw;
    } catch (system_error &e) {
        LOG(ERROR) << "engine failure: " << e.what();
        throw internal_error(e.what());
    }
}

execution_result engine::evaluate_in(const workspace &ws) const {
    const string entry_file_name = cfg.toolchain.entry_file_name();

    // 编译完成之前不会运行程序
    compile_outcome compiled = compiler.compile(ws);
    if (compiled.timed_out)
        return timeout{"Compilation time exceeded limit"};

    if (!compiled.ok) {
        compile_diagnostic diagnostic = parse_compile_error(hide_workspace(compiled.diagnostics(), ws), entry_file_name);
        compilation_error error{diagnostic.message, diagnostic.line_number};
        if (error.raw_message.empty())
            error.raw_message = fmt::format("Compilation failed with exitcode {}", compiled.exit_code.value_or(-1));
        return error;
    }

    run_outcome run = supervisor.run(ws);
    if (run.status == process_status::TIMED_OUT)
        return timeout{"Execution time exceeded limit"};

    if (run.exit_code == 0)
        return success{strip_trailing_newline(run.output)};

    string stderr_text = hide_workspace(run.error, ws);
    runtime_diagnostic diagnostic = parse_runtime_error(stderr_text, entry_file_name);

    runtime_error error;
    error.raw_message = boost::algorithm::trim_copy(stderr_text);
    if (error.raw_message.empty())
        error.raw_message = describe_exit(run);
    error.summary = diagnostic.exception_type ? diagnostic.message : error.raw_message;
    error.exception_type = diagnostic.exception_type;
    error.line_number = diagnostic.line_number;
    if (!run.output.empty())
        error.partial_output = strip_trailing_newline(run.output);
    return error;
}

}  // namespace codeeval
