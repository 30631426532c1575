#include "codeeval/compiler.hpp"
#include <glog/logging.h>
#include "codeeval/common/utils.hpp"
#include "codeeval/process.hpp"

namespace codeeval {
using namespace std;

string compile_outcome::diagnostics() const {
    return error.empty() ? output : error;
}

compiler_invoker::compiler_invoker(const engine_config &config)
    : toolchain(config.toolchain), time_limit(config.compile_time_limit), kill_grace(config.kill_grace) {}

compile_outcome compiler_invoker::compile(const workspace &ws) const {
    process_options opt;
    opt.command = make_command(toolchain.compiler, toolchain.compiler_flags, "-d", ws.root_path, ws.entry_file_path);
    opt.work_dir = ws.root_path;
    opt.time_limit = time_limit;
    opt.kill_grace = kill_grace;

    process_result result = run_process(opt);

    compile_outcome outcome;
    outcome.timed_out = result.status == process_status::TIMED_OUT;
    outcome.exit_code = result.exit_code;
    outcome.ok = !outcome.timed_out && result.exit_code == 0;
    outcome.output = move(result.output);
    outcome.error = move(result.error);

    if (outcome.timed_out) {
        LOG(WARNING) << "compilation time limit exceeded in " << ws.root_path;
    } else {
        LOG(INFO) << "compilation finished with exitcode " << *outcome.exit_code << " in " << ws.root_path;
    }
    return outcome;
}

}  // namespace codeeval
