#include "codeeval/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/io_utils.hpp"

namespace codeeval {
using namespace std;
namespace fs = std::filesystem;

workspace_manager::workspace_manager(const engine_config &config)
    : root(config.workspace_root),
      entry_file_name(assert_safe_file_name(config.toolchain.entry_file_name())),
      keep(config.keep_workspace) {}

workspace workspace_manager::acquire(const string &source_text) const {
    // random_generator 不是线程安全的，每次评测单独构造
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());

    workspace ws;
    ws.root_path = root / uuid;
    ws.entry_file_path = ws.root_path / entry_file_name;

    error_code ec;
    fs::create_directories(root, ec);
    if (ec)
        throw workspace_error("unable to create workspace root " + root.string() + ": " + ec.message());

    // create_directory 在目录已经存在时返回 false，这表示 uuid 冲突
    if (!fs::create_directory(ws.root_path, ec) || ec)
        throw workspace_error("unable to create workspace " + ws.root_path.string() +
                              (ec ? ": " + ec.message() : ": already exists"));

    try {
        write_file_content(ws.entry_file_path, source_text);
    } catch (system_error &e) {
        remove_directory_tree(ws.root_path);
        throw workspace_error(string("unable to write source file: ") + e.what());
    }

    LOG(INFO) << "created workspace " << ws.root_path;
    return ws;
}

void workspace_manager::release(const workspace &ws) const noexcept {
    if (ws.root_path.empty()) return;

    if (keep) {
        LOG(INFO) << "keeping workspace " << ws.root_path;
        return;
    }

    if (auto ec = remove_directory_tree(ws.root_path))
        LOG(WARNING) << "unable to remove workspace " << ws.root_path << ": " << ec.message();
}

scoped_workspace::scoped_workspace(const workspace_manager &manager, const string &source_text)
    : manager(&manager), ws(manager.acquire(source_text)) {}

scoped_workspace::scoped_workspace(scoped_workspace &&other) noexcept
    : manager(other.manager), ws(move(other.ws)) {
    other.manager = nullptr;
}

scoped_workspace::~scoped_workspace() {
    if (manager) manager->release(ws);
}

const workspace &scoped_workspace::get() const {
    return ws;
}

const workspace *scoped_workspace::operator->() const {
    return &ws;
}

}  // namespace codeeval
