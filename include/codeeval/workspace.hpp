#pragma once

#include <filesystem>
#include <string>
#include "codeeval/config.hpp"

namespace codeeval {

/**
 * @brief 表示一次评测独占的工作目录
 * 工作目录在评测开始时创建，评测结束（包括超时和内部错误）时被删除，
 * 不会在并发的评测之间共享。
 */
struct workspace {
    /**
     * @brief 工作目录，<workspace_root>/<uuid>
     */
    std::filesystem::path root_path;

    /**
     * @brief 入口源文件，<root_path>/<entry_point><source_extension>
     */
    std::filesystem::path entry_file_path;
};

/**
 * @brief 负责创建和删除工作目录
 */
struct workspace_manager {
    explicit workspace_manager(const engine_config &config);

    /**
     * @brief 创建一个新的工作目录，并将源代码原样写入入口源文件
     * 源文件名必须与源代码声明的入口类名一致，这是工具链的要求。
     * @param source_text 选手代码
     * @return 新的工作目录
     * @throw workspace_error 无法创建目录或写入文件，此时不会残留半成品目录
     */
    workspace acquire(const std::string &source_text) const;

    /**
     * @brief 删除整个工作目录
     * 可以重复调用；删除失败时只记录日志，不会抛出异常。
     */
    void release(const workspace &ws) const noexcept;

private:
    std::filesystem::path root;
    std::string entry_file_name;
    bool keep;
};

/**
 * @brief 工作目录的 RAII 封装
 * 构造时 acquire，析构时 release，保证任何退出路径都会删除工作目录
 */
struct scoped_workspace {
    scoped_workspace(const workspace_manager &manager, const std::string &source_text);
    scoped_workspace(scoped_workspace &&other) noexcept;
    scoped_workspace &operator=(scoped_workspace &&) = delete;
    scoped_workspace(const scoped_workspace &) = delete;
    scoped_workspace &operator=(const scoped_workspace &) = delete;
    ~scoped_workspace();

    const workspace &get() const;
    const workspace *operator->() const;

private:
    const workspace_manager *manager;
    workspace ws;
};

}  // namespace codeeval
