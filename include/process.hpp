#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runner {

struct process_options {
    /**
     * @brief 要执行的命令，command[0] 为可执行文件，在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径
     */
    std::filesystem::path workdir;

    /**
     * @brief 喂给子进程 stdin 的数据，写完后关闭子进程的 stdin
     */
    std::string input;

    /**
     * @brief 时钟时间限制
     * 单位为秒，小于等于 0 表示不限制
     */
    double time_limit = -1;

    /**
     * @brief stdout、stderr 各自最多保存多少字节，超过的部分会被丢弃
     */
    std::size_t output_limit = 1 << 24;
};

struct process_result {
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 子进程的返回码
     * 若子进程因为信号终止，则为 128 + 信号编号；若子进程没有成功启动，则为空
     */
    std::optional<int> exitcode;

    /**
     * @brief 导致子进程终止的信号，-1 表示子进程正常退出
     */
    int signal = -1;

    /**
     * @brief 子进程因为超出时间限制被杀死
     */
    bool timed_out = false;

    /**
     * @brief 可执行文件不存在或者没有执行权限（exec 失败，errno 为 ENOENT、EACCES 或 ENOTDIR）
     */
    bool not_found = false;

    /**
     * @brief exec 失败时的 errno
     */
    int exec_errno = 0;

    /**
     * @brief stdout 或 stderr 超出了 output_limit，多余的输出被丢弃
     */
    bool output_truncated = false;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 子进程的最大常驻内存（来自 wait4 的 ru_maxrss），单位为 KB
     */
    long memory = -1;
};

/**
 * @brief 运行一个外部程序，并收集其输出
 * 1. 创建 stdin、stdout、stderr 管道和一个报告 exec 错误的管道，管道均为 O_CLOEXEC，
 *    避免并发执行的其他子进程继承这些管道导致读不到 EOF
 * 2. 调用 fork 创建子进程
 *    1. 子进程将自己移入一个独立的进程组，以便我们通过 kill(-pid) 杀死进程组内所有进程
 *    2. 恢复 SIGPIPE 的默认处理、清空信号屏蔽字
 *    3. 将管道连接到 stdin/stdout/stderr，切换工作路径，调用 execvp
 *    4. 若 exec 失败，通过错误管道把 errno 告诉父进程
 * 3. 父进程通过 poll 同时写入 stdin、读取 stdout/stderr，直到子进程退出或者超时
 *    1. 超时则先发送 SIGTERM，等待 0.1s 后再发送 SIGKILL
 *    2. 子进程退出后，杀死进程组内残留的进程，确保子进程 fork 出来的进程都不会留驻系统
 * 4. 通过 wait4 回收子进程，得到返回码和内存使用
 *
 * 本函数返回时，子进程一定已经被回收。
 * @throw std::system_error fork、pipe、poll 等系统调用失败，或者子进程在 exec 之前的准备工作失败
 */
process_result run_process(const process_options &opt);

}  // namespace runner
