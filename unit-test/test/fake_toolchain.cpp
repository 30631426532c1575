#include "test/fake_toolchain.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "codeeval/common/io_utils.hpp"

namespace codeeval::test {
using namespace std;
namespace fs = std::filesystem;

static const char *FAKE_JAVAC = R"(#!/bin/sh
# javac [flags...] -d <dir> <source>
for src; do :; done
line=$(grep -n COMPILE_ERROR "$src" | head -n 1 | cut -d: -f1)
if [ -n "$line" ]; then
    echo "$src:$line: error: ';' expected" >&2
    echo "1 error" >&2
    exit 1
fi
if grep -q COMPILE_HANG "$src"; then
    sleep 30
fi
exit 0
)";

static const char *FAKE_JAVA = R"(#!/bin/sh
# java [flags...] -cp <dir> <entry>
while [ "$#" -gt 0 ] && [ "$1" != "-cp" ]; do shift; done
exec /bin/sh "$2/$3.java"
)";

static void write_script(const fs::path &path, const string &content) {
    write_file_content(path, content);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
}

fs::path make_temp_directory(const string &prefix) {
    fs::path dir = fs::temp_directory_path() /
                   (prefix + "-" + boost::lexical_cast<string>(boost::uuids::random_generator()()));
    fs::create_directories(dir);
    return dir;
}

size_t count_entries(const fs::path &dir) {
    if (!fs::exists(dir)) return 0;
    return distance(fs::directory_iterator(dir), fs::directory_iterator());
}

fake_toolchain::fake_toolchain() : dir(make_temp_directory("codeeval-toolchain")) {
    write_script(dir / "javac", FAKE_JAVAC);
    write_script(dir / "java", FAKE_JAVA);
}

fake_toolchain::~fake_toolchain() {
    remove_directory_tree(dir);
}

fs::path fake_toolchain::workspace_root() const {
    return dir / "workspaces";
}

engine_config fake_toolchain::make_config() const {
    engine_config config;
    config.toolchain.compiler = dir / "javac";
    config.toolchain.runtime = dir / "java";
    config.workspace_root = workspace_root();
    config.time_limit = chrono::milliseconds(5000);
    config.compile_time_limit = chrono::milliseconds(5000);
    config.kill_grace = chrono::milliseconds(50);
    return config;
}

}  // namespace codeeval::test
