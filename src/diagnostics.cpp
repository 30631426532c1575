#include "codeeval/diagnostics.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <vector>

namespace codeeval {
using namespace std;

static const char *DIGITS = "0123456789";

static bool is_identifier_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '$';
}

/**
 * @brief 行号必须是正整数，溢出或为 0 时视为无法识别
 */
static optional<int> to_line_number(const string &digits) {
    int value;
    if (!boost::conversion::try_lexical_convert(digits, value) || value <= 0)
        return nullopt;
    return value;
}

/**
 * @brief 检查 text 从 pos 开始是否为一串数字并紧跟 terminator
 * @return 数字的结束位置，不匹配时返回 string::npos
 */
static size_t scan_digits(const string &text, size_t pos, char terminator) {
    size_t end = text.find_first_not_of(DIGITS, pos);
    if (end == pos || end == string::npos || text[end] != terminator)
        return string::npos;
    return end;
}

compile_diagnostic parse_compile_error(const string &raw_text, const string &entry_file_name) noexcept {
    compile_diagnostic result;
    try {
        result.message = boost::algorithm::trim_copy(raw_text);

        // javac 报告错误的格式为 /path/to/Main.java:<line>: error: <message>
        // 文件名前面不能是标识符字符，避免把 NotMain.java:3: 识别为 Main.java 的错误
        const string token = entry_file_name + ":";
        for (size_t pos = raw_text.find(token); pos != string::npos; pos = raw_text.find(token, pos + 1)) {
            if (pos > 0 && is_identifier_char(raw_text[pos - 1])) continue;

            size_t begin = pos + token.size();
            size_t end = scan_digits(raw_text, begin, ':');
            if (end == string::npos) continue;

            result.line_number = to_line_number(raw_text.substr(begin, end - begin));
            break;
        }
    } catch (exception &) {
        // 无法解析时退化为只有原始文本的结果
    }
    return result;
}

/**
 * @brief 识别异常调用栈的第一行
 * Exception in thread "main" java.lang.ArithmeticException: / by zero
 * Exception in thread "main" java.lang.StackOverflowError
 * @return 异常的类名（不含包名），不是调用栈第一行时为空
 */
static optional<string> parse_trace_header(const string &line) {
    static const string prefix = "Exception in thread \"";
    if (!boost::algorithm::starts_with(line, prefix)) return nullopt;

    size_t quote = line.find('"', prefix.size());
    if (quote == string::npos || quote + 1 >= line.size() || line[quote + 1] != ' ') return nullopt;

    size_t begin = quote + 2;
    size_t end = begin;
    while (end < line.size() && (is_identifier_char(line[end]) || line[end] == '.')) ++end;
    if (end == begin || (end < line.size() && line[end] != ':')) return nullopt;

    // 去掉包名，只保留类名
    string full_name = line.substr(begin, end - begin);
    string simple_name = full_name.substr(full_name.find_last_of('.') + 1);
    if (simple_name.empty()) return nullopt;
    return simple_name;
}

/**
 * @brief 识别位于入口源文件的调用栈帧
 *     at Main.main(Main.java:4)
 *     at Main$Node.next(Main.java:12)
 */
static optional<int> parse_trace_frame(const string &line, const string &entry_file_name) {
    size_t at = line.find_first_not_of(" \t");
    if (at == string::npos || line.compare(at, 2, "at") != 0) return nullopt;
    if (at + 2 >= line.size() || (line[at + 2] != ' ' && line[at + 2] != '\t')) return nullopt;

    size_t paren = line.find('(', at + 2);
    if (paren == string::npos || line.compare(paren + 1, entry_file_name.size() + 1, entry_file_name + ":") != 0)
        return nullopt;

    size_t begin = paren + 1 + entry_file_name.size() + 1;
    size_t end = scan_digits(line, begin, ')');
    if (end == string::npos || end + 1 != line.size()) return nullopt;
    return to_line_number(line.substr(begin, end - begin));
}

runtime_diagnostic parse_runtime_error(const string &raw_text, const string &entry_file_name) noexcept {
    runtime_diagnostic result;
    try {
        result.message = boost::algorithm::trim_copy(raw_text);

        vector<string> lines;
        boost::split(lines, raw_text, boost::is_any_of("\n"));
        for (auto &line : lines) {
            boost::algorithm::trim_right(line);

            if (!result.exception_type) {
                if (auto type = parse_trace_header(line)) {
                    result.exception_type = type;
                    result.message = line;
                    continue;
                }
            }
            if (!result.line_number)
                result.line_number = parse_trace_frame(line, entry_file_name);
        }
    } catch (exception &) {
        // 无法解析时退化为只有原始文本的结果
    }
    return result;
}

}  // namespace codeeval
