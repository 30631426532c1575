#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/io_utils.hpp"
#include "codeeval/workspace.hpp"
#include "gtest/gtest.h"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace codeeval;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = test::make_temp_directory("codeeval-workspace");
        config.workspace_root = root / "workspaces";
    }

    void TearDown() override {
        remove_directory_tree(root);
    }

    fs::path root;
    engine_config config;
};

TEST_F(WorkspaceTest, AcquireAndReleaseTest) {
    workspace_manager manager(config);
    workspace ws = manager.acquire("class Main {}\n");

    EXPECT_TRUE(fs::is_directory(ws.root_path));
    EXPECT_EQ(ws.root_path.parent_path().string(), config.workspace_root.string());
    EXPECT_EQ(ws.entry_file_path.string(), (ws.root_path / "Main.java").string());
    EXPECT_EQ(read_file_content(ws.entry_file_path), "class Main {}\n");

    manager.release(ws);
    EXPECT_FALSE(fs::exists(ws.root_path));

    // 重复释放不会出错
    manager.release(ws);
}

TEST_F(WorkspaceTest, SourceWrittenVerbatimTest) {
    workspace_manager manager(config);
    string source("line1\r\nline2\0tail", 17);
    scoped_workspace ws(manager, source);
    EXPECT_EQ(read_file_content(ws->entry_file_path), source);
}

TEST_F(WorkspaceTest, DistinctWorkspacesTest) {
    workspace_manager manager(config);
    scoped_workspace a(manager, "a");
    scoped_workspace b(manager, "b");
    EXPECT_NE(a->root_path.string(), b->root_path.string());
    EXPECT_EQ(read_file_content(a->entry_file_path), "a");
    EXPECT_EQ(read_file_content(b->entry_file_path), "b");
}

TEST_F(WorkspaceTest, ScopedWorkspaceRemovedTest) {
    workspace_manager manager(config);
    fs::path path;
    {
        scoped_workspace ws(manager, "source");
        path = ws->root_path;
        write_file_content(path / "Main.class", "compiled");
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(test::count_entries(config.workspace_root), 0u);
}

TEST_F(WorkspaceTest, ScopedWorkspaceMovedTest) {
    workspace_manager manager(config);
    fs::path path;
    {
        scoped_workspace outer = [&] {
            scoped_workspace inner(manager, "source");
            path = inner->root_path;
            return inner;
        }();
        EXPECT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkspaceTest, KeepWorkspaceTest) {
    config.keep_workspace = true;
    workspace_manager manager(config);
    fs::path path;
    {
        scoped_workspace ws(manager, "source");
        path = ws->root_path;
    }
    EXPECT_TRUE(fs::exists(path / "Main.java"));
}

TEST_F(WorkspaceTest, UnsafeEntryPointTest) {
    config.toolchain.entry_point = "../Main";
    EXPECT_THROW(workspace_manager manager(config), invalid_argument);
}

TEST_F(WorkspaceTest, UnwritableRootTest) {
    // 根目录的父路径是一个普通文件，无法创建目录
    write_file_content(root / "file", "");
    config.workspace_root = root / "file" / "workspaces";
    workspace_manager manager(config);
    EXPECT_THROW(manager.acquire("source"), workspace_error);
}
