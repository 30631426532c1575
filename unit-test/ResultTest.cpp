#include "codeeval/result.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace codeeval;

TEST(ResultTest, DisplayMessageTest) {
    EXPECT_STREQ(get_display_message(status::SUCCESS), "Success");
    EXPECT_STREQ(get_display_message(status::COMPILATION_ERROR), "CompilationError");
    EXPECT_STREQ(get_display_message(status::RUNTIME_ERROR), "RuntimeError");
    EXPECT_STREQ(get_display_message(status::TIMEOUT), "Timeout");
}

TEST(ResultTest, StatusOfResultTest) {
    EXPECT_EQ(get_status(success{"x"}), status::SUCCESS);
    EXPECT_EQ(get_status(compilation_error{"x", nullopt}), status::COMPILATION_ERROR);
    EXPECT_EQ(get_status(codeeval::runtime_error{}), status::RUNTIME_ERROR);
    EXPECT_EQ(get_status(timeout{"x"}), status::TIMEOUT);
}

TEST(ResultTest, StripTrailingNewlineTest) {
    EXPECT_EQ(strip_trailing_newline("Hello!\n"), "Hello!");
    EXPECT_EQ(strip_trailing_newline("Hello!\r\n"), "Hello!");
    EXPECT_EQ(strip_trailing_newline("Hello!"), "Hello!");
    EXPECT_EQ(strip_trailing_newline("a\n\n"), "a\n");
    EXPECT_EQ(strip_trailing_newline("\n"), "");
    EXPECT_EQ(strip_trailing_newline(""), "");
    EXPECT_EQ(strip_trailing_newline("  a  \n"), "  a  ");
}

TEST(ResultTest, SuccessJsonTest) {
    execution_result result = success{"Hello!"};
    EXPECT_JSON_EQ(to_json(result), R"({
        "status": "Success",
        "error_message": null,
        "output": "Hello!"
    })"_json);
}

TEST(ResultTest, CompilationErrorJsonTest) {
    execution_result result = compilation_error{"Main.java:3: error: ';' expected", 3};
    EXPECT_JSON_EQ(to_json(result), R"({
        "status": "CompilationError",
        "error_message": "Main.java:3: error: ';' expected",
        "line_number": 3,
        "output": null
    })"_json);

    execution_result no_line = compilation_error{"error: invalid flag", nullopt};
    EXPECT_TRUE(to_json(no_line)["line_number"].is_null());
}

TEST(ResultTest, RuntimeErrorJsonTest) {
    codeeval::runtime_error error;
    error.raw_message = "Exception in thread \"main\" java.lang.ArithmeticException: / by zero\n\tat Main.main(Main.java:4)";
    error.summary = "Exception in thread \"main\" java.lang.ArithmeticException: / by zero";
    error.exception_type = "ArithmeticException";
    error.line_number = 4;
    error.partial_output = "before";

    execution_result result = error;
    EXPECT_JSON_EQ(to_json(result), R"json({
        "status": "RuntimeError",
        "error_message": "Exception in thread \"main\" java.lang.ArithmeticException: / by zero",
        "raw_message": "Exception in thread \"main\" java.lang.ArithmeticException: / by zero\n\tat Main.main(Main.java:4)",
        "exception_type": "ArithmeticException",
        "line_number": 4,
        "output": "before"
    })json"_json);
}

TEST(ResultTest, RuntimeErrorWithoutDiagnosticsJsonTest) {
    codeeval::runtime_error error;
    error.raw_message = error.summary = "Process exited with code 3";

    execution_result result = error;
    EXPECT_JSON_EQ(to_json(result), R"({
        "status": "RuntimeError",
        "error_message": "Process exited with code 3",
        "raw_message": "Process exited with code 3",
        "exception_type": null,
        "line_number": null,
        "output": null
    })"_json);
}

TEST(ResultTest, TimeoutJsonTest) {
    execution_result result = timeout{"Execution time exceeded limit"};
    EXPECT_JSON_EQ(to_json(result), R"({
        "status": "Timeout",
        "error_message": "Execution time exceeded limit",
        "output": null
    })"_json);
}
