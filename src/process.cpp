#include "codeeval/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cerrno>
#include <system_error>
#include <thread>
#include "codeeval/common/exceptions.hpp"
#include "codeeval/common/utils.hpp"

namespace codeeval {
using namespace std;

const int BUF_SIZE = 65536;

// 每次 pump 最多读取的块数，避免持续输出的子进程让我们错过时间限制
const int MAX_CHUNKS_PER_PUMP = 16;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const chrono::milliseconds poll_interval{10};

// 进程组被杀死后等待管道 EOF 的最长时间
const chrono::milliseconds drain_limit{500};

static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

static string errno_message(int err) {
    return error_code(err, system_category()).message();
}

unique_fd::unique_fd() : fd(-1) {}

unique_fd::unique_fd(int fd) : fd(fd) {}

unique_fd::unique_fd(unique_fd &&other) noexcept : fd(other.fd) {
    other.fd = -1;
}

unique_fd &unique_fd::operator=(unique_fd &&other) noexcept {
    if (this != &other) {
        reset(other.fd);
        other.fd = -1;
    }
    return *this;
}

unique_fd::~unique_fd() {
    reset();
}

int unique_fd::get() const {
    return fd;
}

bool unique_fd::valid() const {
    return fd >= 0;
}

void unique_fd::reset(int new_fd) {
    if (fd >= 0) close(fd);
    fd = new_fd;
}

process_handle::process_handle(pid_t pid)
    : process_id(pid), is_reaped(false), status(0) {}

process_handle::process_handle(process_handle &&other) noexcept
    : process_id(other.process_id), is_reaped(other.is_reaped), status(other.status) {
    other.is_reaped = true;
}

process_handle::~process_handle() {
    if (reaped()) return;
    try {
        signal_group(SIGKILL);
        wait();
    } catch (exception &e) {
        LOG(ERROR) << "unable to kill process group " << process_id << ": " << e.what();
    }
}

pid_t process_handle::pid() const {
    return process_id;
}

bool process_handle::reaped() const {
    return is_reaped;
}

optional<int> process_handle::try_wait() {
    if (is_reaped) return status;

    int st = 0;
    pid_t r;
    do {
        r = waitpid(process_id, &st, WNOHANG);
    } while (r == -1 && errno == EINTR);

    if (r == -1) error(errno, fmt::format("waiting on child {}", process_id));
    if (r == 0) return nullopt;

    is_reaped = true;
    status = st;
    return status;
}

int process_handle::wait() {
    if (is_reaped) return status;

    int st = 0;
    pid_t r;
    do {
        r = waitpid(process_id, &st, 0);
    } while (r == -1 && errno == EINTR);

    if (r == -1) error(errno, fmt::format("waiting on child {}", process_id));

    is_reaped = true;
    status = st;
    return status;
}

void process_handle::signal_group(int sig) {
    if (killpg(process_id, sig) != 0 && errno != ESRCH) {
        throw termination_error(fmt::format("unable to send signal {} to process group {}: {}",
                                            sig, process_id, errno_message(errno)));
    }
}

int process_handle::terminate(chrono::milliseconds grace) {
    // First try to kill graciously, then hard.
    LOG(INFO) << "sending SIGTERM to process group " << process_id;
    signal_group(SIGTERM);

    if (grace.count() > 0) this_thread::sleep_for(grace);

    LOG(INFO) << "sending SIGKILL to process group " << process_id;
    signal_group(SIGKILL);

    return wait();
}

static void make_pipe(unique_fd &read_end, unique_fd &write_end) {
    int fds[2];
    // O_CLOEXEC: 并发评测时其他线程 fork 出的子进程不能继承这个管道，否则我们等不到 EOF
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw spawn_error(fmt::format("unable to create pipe: {}", errno_message(errno)));
    read_end.reset(fds[PIPE_READ]);
    write_end.reset(fds[PIPE_WRITE]);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief 子进程中 exec 失败时，将 errno 通过管道告知父进程并退出
 */
[[noreturn]] static void report_exec_failure(int status_fd) {
    int err = errno;
    ssize_t written = write(status_fd, &err, sizeof(err));
    (void)written;  // 忽略
    _exit(127);
}

/**
 * @brief fork 之后在子进程中执行，只能调用 async-signal-safe 的函数
 */
[[noreturn]] static void exec_child(char **args, const char *work_dir,
                                    int null_fd, int output_fd, int error_fd, int status_fd) {
    // 分离到独立的进程组，以便我们通过 killpg 可以杀死进程组内所有进程
    setpgid(0, 0);

    // 恢复默认的信号处理，忽略的信号会在 exec 后继续被忽略
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);
    sigaction(SIGINT, &sigact, nullptr);
    sigaction(SIGTERM, &sigact, nullptr);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    if (work_dir[0] && chdir(work_dir) != 0)
        report_exec_failure(status_fd);

    if (dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(output_fd, STDOUT_FILENO) < 0 ||
        dup2(error_fd, STDERR_FILENO) < 0)
        report_exec_failure(status_fd);

    execvp(args[0], args);
    report_exec_failure(status_fd);
}

spawned_process spawn(const process_options &opt) {
    if (opt.command.empty())
        throw spawn_error("no command to spawn");

    // 在 fork 之前准备好所有参数
    vector<char *> args;
    for (auto &arg : opt.command)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string work_dir = opt.work_dir.string();

    unique_fd output_read, output_write, error_read, error_write, status_read, status_write;
    make_pipe(output_read, output_write);
    make_pipe(error_read, error_write);
    make_pipe(status_read, status_write);

    unique_fd null_fd(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_fd.valid())
        throw spawn_error(fmt::format("unable to open /dev/null: {}", errno_message(errno)));

    DLOG(INFO) << "spawning " << boost::algorithm::join(opt.command, " ")
               << " in " << (work_dir.empty() ? "." : work_dir);

    pid_t pid = fork();
    if (pid == -1)
        throw spawn_error(fmt::format("unable to fork: {}", errno_message(errno)));

    if (pid == 0) {
        exec_child(args.data(), work_dir.c_str(),
                   null_fd.get(), output_write.get(), error_write.get(), status_write.get());
    }

    // 与子进程同时设置进程组，避免在子进程调用 setpgid 之前就需要杀死进程组
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "unable to set process group of " << pid << ": " << errno_message(errno);

    process_handle handle(pid);

    output_write.reset();
    error_write.reset();
    status_write.reset();
    null_fd.reset();

    // exec 成功时管道因 O_CLOEXEC 被关闭，我们读到 EOF；否则读到子进程的 errno
    int child_errno = 0;
    ssize_t nread;
    do {
        nread = read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (nread == -1 && errno == EINTR);

    if (nread > 0) {
        handle.wait();
        throw spawn_error(fmt::format("unable to start command {}: {}", opt.command[0], errno_message(child_errno)));
    }

    set_nonblocking(output_read.get());
    set_nonblocking(error_read.get());

    return spawned_process{move(handle), move(output_read), move(error_read)};
}

/**
 * @brief 读取管道中已经可读的数据，读到 EOF 时关闭管道
 */
static void pump_pipe(unique_fd &fd, string &buffer) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_CHUNKS_PER_PUMP && fd.valid(); ++i) {
        ssize_t nread = read(fd.get(), buf, BUF_SIZE);
        if (nread > 0) {
            buffer.append(buf, nread);
        } else if (nread == 0) {
            /* EOF detected: close fd */
            fd.reset();
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            error(errno, "reading child output");
        }
    }
}

/**
 * @brief 等待任一管道可读，或者 timeout 到期；没有打开的管道时相当于 sleep
 */
static void wait_readable(spawned_process &proc, chrono::milliseconds timeout) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    for (unique_fd *fd : {&proc.output, &proc.error}) {
        if (fd->valid()) {
            fds[nfds].fd = fd->get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
    }

    int r = poll(fds, nfds, (int)max<chrono::milliseconds::rep>(timeout.count(), 0));
    if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
}

process_result supervise(spawned_process &proc, const process_options &opt) {
    elapsed_time timer;
    const auto deadline = chrono::steady_clock::now() + opt.time_limit;
    process_result result;
    optional<int> status;

    while (true) {
        pump_pipe(proc.output, result.output);
        pump_pipe(proc.error, result.error);

        if ((status = proc.handle.try_wait())) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) break;

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1);
        wait_readable(proc, min(remaining, poll_interval));
    }

    if (!status) {
        LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {} ms): aborting command {}",
                                    opt.time_limit.count(), opt.command[0]);
        result.status = process_status::TIMED_OUT;
        status = proc.handle.terminate(opt.kill_grace);
    } else {
        // 子进程已经退出，杀死进程组内残留的进程，确保选手 fork 出来的子进程都不会留驻系统
        proc.handle.signal_group(SIGKILL);
    }

    const auto drain_deadline = chrono::steady_clock::now() + drain_limit;
    while ((proc.output.valid() || proc.error.valid()) && chrono::steady_clock::now() < drain_deadline) {
        wait_readable(proc, poll_interval);
        pump_pipe(proc.output, result.output);
        pump_pipe(proc.error, result.error);
    }
    if (proc.output.valid() || proc.error.valid()) {
        LOG(WARNING) << "output of " << opt.command[0] << " is still open after its process group was killed";
        proc.output.reset();
        proc.error.reset();
    }

    if (WIFEXITED(*status)) {
        result.exit_code = WEXITSTATUS(*status);
    } else if (WIFSIGNALED(*status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(*status);
        result.exit_code = *result.signal + 128;
    }
    if (result.status == process_status::TIMED_OUT)
        result.exit_code.reset();

    result.wall_time = timer.duration<chrono::milliseconds>();
    LOG(INFO) << fmt::format("{} finished in {} ms, exitcode {}", opt.command[0], result.wall_time.count(),
                             result.exit_code ? to_string(*result.exit_code) : string("none"));
    return result;
}

process_result run_process(const process_options &opt) {
    spawned_process proc = spawn(opt);
    return supervise(proc, opt);
}

}  // namespace codeeval
