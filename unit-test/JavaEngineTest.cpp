#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/io_utils.hpp"
#include "codeeval/engine.hpp"
#include "codeeval/process.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace codeeval;
using ::testing::HasSubstr;

/**
 * @brief 使用系统中安装的 JDK 进行评测，没有 JDK 时跳过
 */
class JavaEngineTest : public ::testing::Test {
protected:
    static bool has_jdk() {
        process_options opt;
        opt.command = {"javac", "-version"};
        opt.time_limit = chrono::milliseconds(30000);
        try {
            return run_process(opt).exit_code == 0;
        } catch (spawn_error &) {
            return false;
        }
    }

    void SetUp() override {
        if (!has_jdk()) GTEST_SKIP() << "javac is not installed";
        root = test::make_temp_directory("codeeval-java");
        config.workspace_root = root;
        config.compile_time_limit = chrono::milliseconds(60000);
        config.time_limit = chrono::milliseconds(10000);
    }

    void TearDown() override {
        if (!root.empty()) remove_directory_tree(root);
    }

    filesystem::path root;
    engine_config config;
};

TEST_F(JavaEngineTest, HelloWorldTest) {
    engine eng(config);
    execution_result result = eng.evaluate(R"(public class Main {
    public static void main(String[] args) {
        System.out.println("Hello!");
    }
}
)");
    ASSERT_TRUE(holds_alternative<success>(result)) << to_json(result).dump(2);
    EXPECT_EQ(get<success>(result).stdout_output, "Hello!");
}

TEST_F(JavaEngineTest, MissingSemicolonTest) {
    engine eng(config);
    execution_result result = eng.evaluate(R"(public class Main {
    public static void main(String[] args) {
        System.out.println("Hello!")
    }
}
)");
    ASSERT_TRUE(holds_alternative<compilation_error>(result)) << to_json(result).dump(2);
    auto &error = get<compilation_error>(result);
    EXPECT_EQ(error.line_number, 3);
    EXPECT_THAT(error.raw_message, HasSubstr("';' expected"));
    EXPECT_THAT(error.raw_message, ::testing::Not(HasSubstr(root.string())));
}

TEST_F(JavaEngineTest, DivisionByZeroTest) {
    engine eng(config);
    execution_result result = eng.evaluate(R"(public class Main {
    public static void main(String[] args) {
        int zero = 0;
        System.out.println(10 / zero);
    }
}
)");
    ASSERT_TRUE(holds_alternative<codeeval::runtime_error>(result)) << to_json(result).dump(2);
    auto &error = get<codeeval::runtime_error>(result);
    EXPECT_EQ(error.exception_type, "ArithmeticException");
    EXPECT_EQ(error.line_number, 4);
    EXPECT_THAT(error.summary, HasSubstr("/ by zero"));
}

TEST_F(JavaEngineTest, InfiniteLoopTest) {
    config.time_limit = chrono::milliseconds(2000);
    engine eng(config);
    execution_result result = eng.evaluate(R"(public class Main {
    public static void main(String[] args) {
        while (true) {}
    }
}
)");
    ASSERT_TRUE(holds_alternative<timeout>(result)) << to_json(result).dump(2);
    EXPECT_EQ(get<timeout>(result).raw_message, "Execution time exceeded limit");
}
