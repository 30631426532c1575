#include "codeeval/runtime.hpp"
#include <glog/logging.h>
#include "codeeval/common/utils.hpp"

namespace codeeval {
using namespace std;

runtime_supervisor::runtime_supervisor(const engine_config &config)
    : toolchain(config.toolchain), default_time_limit(config.time_limit), kill_grace(config.kill_grace) {}

run_outcome runtime_supervisor::run(const workspace &ws) const {
    return run(ws, default_time_limit);
}

run_outcome runtime_supervisor::run(const workspace &ws, chrono::milliseconds time_limit) const {
    process_options opt;
    // -cp 限制 classpath 只包含工作目录
    opt.command = make_command(toolchain.runtime, toolchain.runtime_flags, "-cp", ws.root_path, toolchain.entry_point);
    opt.work_dir = ws.root_path;
    opt.time_limit = time_limit;
    opt.kill_grace = kill_grace;

    process_result result = run_process(opt);

    run_outcome outcome;
    outcome.status = result.status;
    outcome.output = move(result.output);
    outcome.error = move(result.error);
    outcome.exit_code = result.exit_code;
    outcome.signal = result.signal;
    outcome.wall_time = result.wall_time;
    return outcome;
}

}  // namespace codeeval
