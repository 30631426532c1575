#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含启动、监控、终止子进程的工具，编译器调用和选手程序运行共用这些工具
 * 1. 子进程通过 fork 创建，并在 exec 之前调用 setpgid 分离到一个独立的进程组，
 *    以便我们通过 killpg 可以杀死进程组内所有进程（包括选手程序 fork 出来的进程）
 * 2. 子进程的 stdin 重定向到 /dev/null，stdout/stderr 通过非阻塞管道传给父进程，
 *    父进程使用 poll 边运行边读取，避免子进程因管道写满而阻塞
 * 3. 时钟时间超限后先发送 SIGTERM，等待 kill_grace 后发送 SIGKILL，最后回收子进程
 * 4. 子进程正常退出后，进程组内残留的进程也会被 SIGKILL，确保不会有进程留驻系统
 */
namespace codeeval {

/**
 * @brief 文件描述符的 RAII 封装，析构时关闭
 */
struct unique_fd {
    unique_fd();
    explicit unique_fd(int fd);
    unique_fd(unique_fd &&other) noexcept;
    unique_fd &operator=(unique_fd &&other) noexcept;
    unique_fd(const unique_fd &) = delete;
    unique_fd &operator=(const unique_fd &) = delete;
    ~unique_fd();

    int get() const;
    bool valid() const;
    void reset(int fd = -1);

private:
    int fd;
};

enum class process_status {
    /**
     * @brief 子进程在时间限制内自行退出
     */
    COMPLETED,

    /**
     * @brief 子进程超出时钟时间限制，已被强制终止
     */
    TIMED_OUT
};

struct process_options {
    /**
     * @brief 外部命令的路径 (command[0]) 和参数，command[0] 不含 "/" 时从 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承父进程的工作路径
     */
    std::filesystem::path work_dir;

    std::chrono::milliseconds time_limit{5000};

    std::chrono::milliseconds kill_grace{100};
};

struct process_result {
    process_status status = process_status::COMPLETED;

    /**
     * @brief 子进程的返回码
     * 若子进程因为信号崩溃，则为 128 + 信号值；超时时为空
     */
    std::optional<int> exit_code;

    /**
     * @brief 导致子进程终止的信号
     */
    std::optional<int> signal;

    std::string output;

    std::string error;

    std::chrono::milliseconds wall_time{0};
};

/**
 * @brief 持有一个子进程及其进程组
 * 析构时若子进程还未被回收，则杀死整个进程组并回收子进程。
 */
struct process_handle {
    explicit process_handle(pid_t pid);
    process_handle(process_handle &&other) noexcept;
    process_handle &operator=(process_handle &&) = delete;
    process_handle(const process_handle &) = delete;
    process_handle &operator=(const process_handle &) = delete;
    ~process_handle();

    pid_t pid() const;

    /**
     * @brief 子进程是否已被回收
     */
    bool reaped() const;

    /**
     * @brief 非阻塞地检查子进程是否退出
     * @return 子进程退出时为 waitpid 得到的状态，否则为空
     */
    std::optional<int> try_wait();

    /**
     * @brief 阻塞等待子进程退出
     * @return waitpid 得到的状态
     */
    int wait();

    /**
     * @brief 向整个进程组发送信号，进程组已经不存在时忽略
     * @throw termination_error 无法发送信号
     */
    void signal_group(int sig);

    /**
     * @brief 终止整个进程组：先发送 SIGTERM，等待 grace 后发送 SIGKILL，然后回收子进程
     * @return waitpid 得到的状态
     * @throw termination_error 无法发送信号
     */
    int terminate(std::chrono::milliseconds grace);

private:
    pid_t process_id;
    bool is_reaped;
    int status;
};

struct spawned_process {
    process_handle handle;
    unique_fd output;
    unique_fd error;
};

/**
 * @brief 启动子进程
 * @param opt 子进程的命令和工作路径
 * @return 子进程及其 stdout/stderr 管道的读端
 * @throw spawn_error 无法创建管道、fork 失败、无法切换工作路径或 exec 失败
 */
spawned_process spawn(const process_options &opt);

/**
 * @brief 读取子进程的输出直到子进程退出或超时
 * 超时后会终止整个进程组；正常退出后也会杀死进程组内残留的进程。
 * @throw termination_error 无法终止进程组
 */
process_result supervise(spawned_process &proc, const process_options &opt);

/**
 * @brief 启动子进程并等待其退出或超时
 * @throw spawn_error 无法启动子进程
 * @throw termination_error 无法终止进程组
 */
process_result run_process(const process_options &opt);

}  // namespace codeeval
