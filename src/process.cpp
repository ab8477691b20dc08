#include "process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 65536;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

// 子进程没有输出时，每隔 10ms 检查一次子进程是否退出
const int POLL_INTERVAL_MS = 10;

// 子进程退出后，最多再等待 1s 来读取管道中剩余的数据
const double DRAIN_TIMEOUT = 1;

// 子进程通过错误管道报告失败发生在哪个阶段
const int STAGE_SETUP = 1;
const int STAGE_EXEC = 2;

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0)
        LOG(WARNING) << "closing fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief 忽略 SIGPIPE
 * 子进程可能在读完输入之前就退出了，此时向管道写入数据会产生 SIGPIPE，
 * 默认处理是终止整个进程。忽略之后 write 返回 EPIPE。
 */
static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

/**
 * @brief 子进程报告错误并退出，只能在 fork 之后的子进程中调用
 * 只使用 async-signal-safe 的函数
 */
[[noreturn]] static void report_child_error(int fd, int stage) {
    int data[2] = {stage, errno};
    ssize_t ignored = write(fd, data, sizeof(data));
    (void)ignored;
    _exit(127);
}

/**
 * @brief 检查子进程是否已经退出，但不回收子进程
 * 子进程不被回收时其进程号不会被复用，因此之后仍然可以安全地通过 kill(-pid) 清理进程组
 */
static bool child_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    while (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    return info.si_pid != 0;
}

static void kill_group(pid_t pid, int sig) {
    if (kill(-pid, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send signal " << sig << " to process group " << pid << ": " << strerror(errno);
}

/**
 * @brief 从管道中读取一次数据
 * 超过 limit 的数据会被丢弃，但仍然会被读取，避免子进程因为管道写满而阻塞
 */
static void pump(int &fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, sizeof(buf));
    if (nread > 0) {
        size_t keep = buffer.size() < limit ? min((size_t)nread, limit - buffer.size()) : 0;
        buffer.append(buf, keep);
        if (keep < (size_t)nread) truncated = true;
    } else if (nread == 0) {
        // EOF detected: close fd and indicate this with -1
        close_fd(fd);
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
        error(errno, "reading child output");
    }
}

static void feed(int &fd, const string &input, size_t &written) {
    ssize_t nwritten = write(fd, input.data() + written, min(input.size() - written, (size_t)BUF_SIZE));
    if (nwritten > 0) {
        written += nwritten;
        if (written == input.size()) close_fd(fd);
    } else if (nwritten < 0) {
        if (errno == EPIPE) {
            // 子进程已经关闭了 stdin，不再写入剩余数据
            close_fd(fd);
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            error(errno, "writing child input");
        }
    }
}

/**
 * @brief 等待管道可读写，并搬运一次数据
 * @param timeout_ms poll 的超时时间，所有管道都关闭时相当于 sleep
 */
static void transfer(int &in_fd, int &out_fd, int &err_fd, const process_options &opt, size_t &written, process_result &result, int timeout_ms) {
    struct pollfd fds[3];
    int nfds = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;
    if (out_fd >= 0) {
        out_idx = nfds;
        fds[nfds++] = {out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
        err_idx = nfds;
        fds[nfds++] = {err_fd, POLLIN, 0};
    }
    if (in_fd >= 0) {
        in_idx = nfds;
        fds[nfds++] = {in_fd, POLLOUT, 0};
    }

    int r = poll(fds, nfds, timeout_ms);
    if (r == -1) {
        if (errno == EINTR) return;
        error(errno, "waiting for child data");
    }
    if (r == 0) return;

    if (out_idx >= 0 && fds[out_idx].revents)
        pump(out_fd, result.stdout_text, opt.output_limit, result.output_truncated);
    if (err_idx >= 0 && fds[err_idx].revents)
        pump(err_fd, result.stderr_text, opt.output_limit, result.output_truncated);
    if (in_idx >= 0 && fds[in_idx].revents)
        feed(in_fd, opt.input, written);
}

process_result run_process(const process_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("command should not be empty");
    ignore_sigpipe();

    // fork 之后的子进程只能调用 async-signal-safe 的函数，因此参数需要提前准备好
    vector<char *> argv;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = opt.workdir.string();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
            close_fd(p[PIPE_READ]);
            close_fd(p[PIPE_WRITE]);
        }
    };

    for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
        if (pipe2(p, O_CLOEXEC) != 0) error(errno, "creating pipe");
    }

    DLOG(INFO) << "Running " << boost::algorithm::join(opt.command, " ") << " in " << opt.workdir;

    pid_t pid = fork();
    if (pid == -1) error(errno, "unable to fork");

    if (pid == 0) {  // 子进程
        setpgid(0, 0);

        // 父进程忽略了 SIGPIPE，被忽略的信号会在 exec 后保留，需要恢复默认处理
        signal(SIGPIPE, SIG_DFL);
        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);

        if (dup2(stdin_pipe[PIPE_READ], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[PIPE_WRITE], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[PIPE_WRITE], STDERR_FILENO) < 0)
            report_child_error(error_pipe[PIPE_WRITE], STAGE_SETUP);

        if (!workdir.empty() && chdir(workdir.c_str()) != 0)
            report_child_error(error_pipe[PIPE_WRITE], STAGE_SETUP);

        execvp(argv[0], argv.data());
        report_child_error(error_pipe[PIPE_WRITE], STAGE_EXEC);
    }

    // 父进程
    elapsed_time timer;
    process_result result;
    bool reaped = false;

    try {
        // 和子进程同时设置进程组，避免 kill(-pid) 时子进程还没有来得及调用 setpgid
        if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
            LOG(WARNING) << "setting process group of " << pid << ": " << strerror(errno);

        close_fd(stdin_pipe[PIPE_READ]);
        close_fd(stdout_pipe[PIPE_WRITE]);
        close_fd(stderr_pipe[PIPE_WRITE]);
        close_fd(error_pipe[PIPE_WRITE]);

        // 错误管道在 exec 成功时因为 O_CLOEXEC 被关闭，读到 EOF；exec 失败时读到 errno
        int child_error[2];
        ssize_t nread;
        do {
            nread = read(error_pipe[PIPE_READ], child_error, sizeof(child_error));
        } while (nread == -1 && errno == EINTR);
        if (nread == -1) error(errno, "reading exec status of child");

        if (nread == sizeof(child_error)) {
            int status;
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
            reaped = true;

            if (child_error[0] != STAGE_EXEC)
                error(child_error[1], fmt::format("preparing child process for {}", opt.command[0]));
            if (child_error[1] != ENOENT && child_error[1] != EACCES && child_error[1] != ENOTDIR)
                error(child_error[1], fmt::format("executing {}", opt.command[0]));

            LOG(WARNING) << "unable to start command " << opt.command[0] << ": " << strerror(child_error[1]);
            result.not_found = true;
            result.exec_errno = child_error[1];
            return result;
        }

        set_nonblock(stdin_pipe[PIPE_WRITE]);
        set_nonblock(stdout_pipe[PIPE_READ]);
        set_nonblock(stderr_pipe[PIPE_READ]);

        size_t written = 0;
        if (opt.input.empty()) close_fd(stdin_pipe[PIPE_WRITE]);

        while (!child_exited(pid)) {
            int timeout_ms = POLL_INTERVAL_MS;
            if (opt.time_limit > 0) {
                double remaining = opt.time_limit - timer.seconds();
                if (remaining <= 0) {
                    result.timed_out = true;
                    break;
                }
                timeout_ms = min(timeout_ms, (int)ceil(remaining * 1000));
            }
            transfer(stdin_pipe[PIPE_WRITE], stdout_pipe[PIPE_READ], stderr_pipe[PIPE_READ], opt, written, result, timeout_ms);
        }
        result.wall_time = timer.seconds();

        if (result.timed_out) {
            LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command {}", opt.time_limit, opt.command[0]);

            // First try to kill graciously, then hard.
            kill_group(pid, SIGTERM);
            nanosleep(&killdelay, nullptr);
            kill_group(pid, SIGKILL);
        } else {
            // 子进程已经退出但还没有被回收，杀死进程组内残留的进程
            kill_group(pid, SIGKILL);
        }

        // 读取管道中剩余的数据，进程组内的进程都被杀死后管道会读到 EOF
        close_fd(stdin_pipe[PIPE_WRITE]);
        elapsed_time drain_timer;
        while ((stdout_pipe[PIPE_READ] >= 0 || stderr_pipe[PIPE_READ] >= 0) && drain_timer.seconds() < DRAIN_TIMEOUT) {
            transfer(stdin_pipe[PIPE_WRITE], stdout_pipe[PIPE_READ], stderr_pipe[PIPE_READ], opt, written, result, POLL_INTERVAL_MS);
        }
        if (stdout_pipe[PIPE_READ] >= 0 || stderr_pipe[PIPE_READ] >= 0)
            LOG(WARNING) << "output of " << opt.command[0] << " is still open after the process group was killed";

        int status = 0;
        struct rusage usage;
        while (wait4(pid, &status, 0, &usage) == -1) {
            if (errno != EINTR) error(errno, "waiting on child");
        }
        reaped = true;

        if (WIFEXITED(status)) {
            result.exitcode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
            result.exitcode = result.signal + 128;
            if (!result.timed_out)
                LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
        }
        result.memory = usage.ru_maxrss;

        if (result.output_truncated)
            LOG(WARNING) << "output of " << opt.command[0] << " exceeded " << opt.output_limit << " bytes and was truncated";
    } catch (...) {
        // 不能把正在运行的子进程留给调用者，杀死并回收后继续抛出
        if (!reaped) {
            kill_group(pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {}
        }
        throw;
    }

    return result;
}

}  // namespace runner
