#include "codeeval/result.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codeeval {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::COMPILATION_ERROR, "CompilationError")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::TIMEOUT, "Timeout");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

status get_status(const execution_result &result) {
    return static_cast<status>(result.index());
}

string strip_trailing_newline(const string &text) {
    if (text.size() >= 2 && text.compare(text.size() - 2, 2, "\r\n") == 0)
        return text.substr(0, text.size() - 2);
    if (!text.empty() && text.back() == '\n')
        return text.substr(0, text.size() - 1);
    return text;
}

template <typename T>
static nlohmann::json optional_value(const optional<T> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json &j, const success &result) {
    j = {{"status", get_display_message(status::SUCCESS)},
         {"error_message", nullptr},
         {"output", result.stdout_output}};
}

void to_json(nlohmann::json &j, const compilation_error &result) {
    j = {{"status", get_display_message(status::COMPILATION_ERROR)},
         {"error_message", result.raw_message},
         {"line_number", optional_value(result.line_number)},
         {"output", nullptr}};
}

void to_json(nlohmann::json &j, const runtime_error &result) {
    j = {{"status", get_display_message(status::RUNTIME_ERROR)},
         {"error_message", result.summary},
         {"raw_message", result.raw_message},
         {"exception_type", optional_value(result.exception_type)},
         {"line_number", optional_value(result.line_number)},
         {"output", optional_value(result.partial_output)}};
}

void to_json(nlohmann::json &j, const timeout &result) {
    j = {{"status", get_display_message(status::TIMEOUT)},
         {"error_message", result.raw_message},
         {"output", nullptr}};
}

nlohmann::json to_json(const execution_result &result) {
    return visit([](auto &&value) { return nlohmann::json(value); }, result);
}

}  // namespace codeeval
