#include "process.hpp"
#include <signal.h>
#include <chrono>
#include <thread>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

static process_options shell(const string &script, double time_limit = 5) {
    process_options opt;
    opt.command = {"/bin/sh", "-c", script};
    opt.workdir = "/tmp";
    opt.time_limit = time_limit;
    return opt;
}

/**
 * @brief 进程不存在或者已经是僵尸进程
 * 被杀死的孤儿进程由 init 回收，这里最多等待 2 秒
 */
static bool process_gone(pid_t pid) {
    for (int i = 0; i < 200; ++i) {
        filesystem::path proc = "/proc/" + to_string(pid) + "/stat";
        string stat = filesystem::exists(proc) ? read_file_content(proc) : "";
        auto state = stat.rfind(')');
        if (stat.empty() || (state != string::npos && state + 2 < stat.size() && stat[state + 2] == 'Z'))
            return true;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return false;
}

TEST(ProcessTest, CapturesStdoutAndStderr) {
    process_result result = run_process(shell("echo hello; echo oops >&2"));
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "oops\n");
    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.not_found);
    EXPECT_GE(result.wall_time, 0);
    EXPECT_GT(result.memory, 0);
}

TEST(ProcessTest, FeedsStdin) {
    process_options opt;
    opt.command = {"cat"};
    opt.workdir = "/tmp";
    opt.input = "line 1\nline 2\n";
    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text, "line 1\nline 2\n");
}

TEST(ProcessTest, EmptyStdinIsClosed) {
    process_options opt;
    opt.command = {"cat"};
    opt.workdir = "/tmp";
    opt.time_limit = 5;
    process_result result = run_process(opt);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.exitcode, 0);
}

TEST(ProcessTest, LargeInputAndOutputDoNotDeadlock) {
    process_options opt;
    opt.command = {"cat"};
    opt.workdir = "/tmp";
    opt.time_limit = 10;
    opt.input = string(4 << 20, 'x');
    process_result result = run_process(opt);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_text.size(), opt.input.size());
}

TEST(ProcessTest, ChildIgnoringStdinDoesNotKillHost) {
    process_options opt = shell("exec 0<&-; echo done");
    opt.input = string(1 << 20, 'x');
    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_EQ(result.exitcode, 0);
}

TEST(ProcessTest, RunsInWorkdir) {
    process_options opt = shell("pwd");
    opt.workdir = "/";
    process_result result = run_process(opt);
    EXPECT_EQ(result.stdout_text, "/\n");
}

TEST(ProcessTest, ReportsExitCode) {
    process_result result = run_process(shell("exit 3"));
    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 3);
}

TEST(ProcessTest, SignalledProcessExitCode) {
    process_result result = run_process(shell("kill -9 $$"));
    EXPECT_EQ(result.signal, SIGKILL);
    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 128 + SIGKILL);
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessTest, MissingExecutableIsNotFound) {
    process_options opt;
    opt.command = {"definitely-not-an-installed-command"};
    opt.workdir = "/tmp";
    process_result result = run_process(opt);
    EXPECT_TRUE(result.not_found);
    EXPECT_EQ(result.exec_errno, ENOENT);
    EXPECT_FALSE(result.exitcode);
}

TEST(ProcessTest, MissingAbsolutePathIsNotFound) {
    process_options opt;
    opt.command = {"/tmp/test/no/such/program"};
    opt.workdir = "/tmp";
    process_result result = run_process(opt);
    EXPECT_TRUE(result.not_found);
    EXPECT_FALSE(result.exitcode);
}

TEST(ProcessTest, SymlinkLoopThrowsSystemError) {
    filesystem::path dir("/tmp/test/loop");
    filesystem::create_directories(dir);
    filesystem::remove(dir / "a");
    filesystem::remove(dir / "b");
    filesystem::create_symlink("b", dir / "a");
    filesystem::create_symlink("a", dir / "b");

    process_options opt;
    opt.command = {(dir / "a").string()};
    opt.workdir = "/tmp";
    EXPECT_THROW(run_process(opt), system_error);
    filesystem::remove_all(dir);
}

TEST(ProcessTest, TimeoutKillsProcess) {
    elapsed_time timer;
    process_result result = run_process(shell("echo started; sleep 10", 0.5));
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(timer.seconds(), 3);
    EXPECT_GE(result.wall_time, 0.5);
    EXPECT_EQ(result.stdout_text, "started\n");
}

TEST(ProcessTest, TimeoutKillsProcessIgnoringSigterm) {
    elapsed_time timer;
    process_result result = run_process(shell("trap '' TERM; while true; do :; done", 0.3));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_LT(timer.seconds(), 3);
}

TEST(ProcessTest, TimeoutKillsWholeProcessGroup) {
    process_result result = run_process(shell("sleep 30 & echo $!; wait", 0.5));
    EXPECT_TRUE(result.timed_out);
    pid_t background = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.stdout_text));
    EXPECT_TRUE(process_gone(background));
}

TEST(ProcessTest, NormalExitKillsLeftoverProcesses) {
    elapsed_time timer;
    process_result result = run_process(shell("sleep 30 & echo $!"));
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_LT(timer.seconds(), 5);
    pid_t background = boost::lexical_cast<pid_t>(boost::algorithm::trim_copy(result.stdout_text));
    EXPECT_TRUE(process_gone(background));
}

TEST(ProcessTest, OutputBeyondLimitIsDiscarded) {
    process_options opt = shell("i=0; while [ $i -lt 100 ]; do printf 0123456789; i=$((i+1)); done");
    opt.output_limit = 25;
    process_result result = run_process(opt);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.stdout_text, "0123456789012345678901234");
    EXPECT_EQ(result.exitcode, 0);
}

TEST(ProcessTest, ConcurrentProcessesDoNotShareOutput) {
    vector<thread> threads;
    vector<process_result> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([i, &results] {
            process_options opt;
            opt.command = {"cat"};
            opt.workdir = "/tmp";
            opt.input = to_string(i);
            opt.time_limit = 5;
            results[i] = run_process(opt);
        });
    }
    for (auto &thd : threads) thd.join();
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_FALSE(results[i].timed_out) << i;
        EXPECT_EQ(results[i].stdout_text, to_string(i));
    }
}
