#include "codeeval/common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace codeeval {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_file_name(const string &name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != string::npos || name.find('\0') != string::npos)
        throw invalid_argument("file name is not safe: " + name);
    return name;
}

error_code remove_directory_tree(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    return ec;
}

}  // namespace codeeval
