#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <system_error>
#include <nlohmann/json.hpp>
#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/io_utils.hpp"
#include "codeeval/config.hpp"
#include "codeeval/engine.hpp"
#include "codeeval/result.hpp"
using namespace std;

static string read_source(const string &source) {
    if (source.empty() || source == "-") {
        return string((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    }
    if (!filesystem::is_regular_file(source))
        throw invalid_argument("source file " + source + " does not exist");
    return codeeval::read_file_content(source);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codeeval options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file")
        ("compiler", po::value<string>(), "set the compiler executable, default to javac. You can either pass it from environ CODEEVAL_COMPILER")
        ("runtime", po::value<string>(), "set the runtime executable, default to java. You can either pass it from environ CODEEVAL_RUNTIME")
        ("entry-point", po::value<string>(), "set the entry class, the source file will be named after it, default to Main")
        ("workspace-dir", po::value<string>(), "set the directory to create per-submission workspaces in. You can either pass it from environ CODEEVAL_WORKSPACE_DIR")
        ("time-limit", po::value<unsigned>(), "set wall time limit in milliseconds for the program, default to 5000. You can either pass it from environ CODEEVAL_TIME_LIMIT")
        ("compile-time-limit", po::value<unsigned>(), "set wall time limit in milliseconds for the compiler, default to 10000")
        ("submitter", po::value<string>(), "set the submitter id used in logs")
        ("debug", "turn on the debug mode not to delete workspaces to check the generated files")
        ("verbose", "also write logs to stderr")
        ("source", po::value<string>(), "source file to evaluate, read from stdin if omitted or '-'")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("source", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return codeeval::E_USAGE_ERROR;
    }

    if (vm.count("help")) {
        cout << "codeeval: compile and run a single-file program, print the classified result as JSON" << endl
             << "Usage: " << argv[0] << " [options] [source-file]" << endl;
        cout << desc << endl;
        return codeeval::E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codeeval 1.0" << endl;
        return codeeval::E_SUCCESS;
    }

    if (vm.count("verbose")) FLAGS_alsologtostderr = true;

    // 构造默认配置也可能失败（比如 TMPDIR 不是目录），因此放在 try 中
    optional<codeeval::engine_config> loaded;
    string source_text;
    try {
        loaded = codeeval::load_engine_config(vm.count("config") ? optional<filesystem::path>(vm["config"].as<string>()) : nullopt);
        codeeval::engine_config &config = *loaded;

        if (vm.count("compiler")) config.toolchain.compiler = vm["compiler"].as<string>();
        if (vm.count("runtime")) config.toolchain.runtime = vm["runtime"].as<string>();
        if (vm.count("entry-point")) config.toolchain.entry_point = vm["entry-point"].as<string>();
        if (vm.count("workspace-dir")) config.workspace_root = vm["workspace-dir"].as<string>();
        if (vm.count("time-limit")) config.time_limit = chrono::milliseconds(vm["time-limit"].as<unsigned>());
        if (vm.count("compile-time-limit")) config.compile_time_limit = chrono::milliseconds(vm["compile-time-limit"].as<unsigned>());
        if (vm.count("debug")) config.keep_workspace = true;

        codeeval::validate_config(config);

        source_text = read_source(vm.count("source") ? vm["source"].as<string>() : "");
        if (source_text.empty())
            throw invalid_argument("source text is empty");
    } catch (invalid_argument &e) {
        cerr << e.what() << endl;
        return codeeval::E_USAGE_ERROR;
    } catch (system_error &e) {
        cerr << e.what() << endl;
        return codeeval::E_USAGE_ERROR;
    }

    codeeval::engine engine(*loaded);
    codeeval::submission submit(source_text, vm.count("submitter") ? vm["submitter"].as<string>() : "");

    try {
        codeeval::execution_result result = engine.evaluate(submit);
        cout << codeeval::to_json(result).dump(2) << endl;
        return codeeval::E_SUCCESS;
    } catch (codeeval::engine_exception &e) {
        // 详细信息只写入日志，不输出服务器的路径和调用栈
        LOG(ERROR) << "unable to evaluate submission: " << e.what();
        nlohmann::json j = {{"status", "InternalError"}, {"error_message", "Internal engine error"}};
        cout << j.dump(2) << endl;
        return codeeval::E_INTERNAL_ERROR;
    }
}
