#include <cctype>
#include <chrono>
#include <thread>
#include "gtest/gtest.h"
#include "starjudge/common/io_utils.hpp"
#include "starjudge/common/utils.hpp"
#include "starjudge/process.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace starjudge;
namespace fs = std::filesystem;

static execution_outcome sh(const string &script, run_options options = run_options()) {
    return run_process("/bin/sh", {"-c", script}, options);
}

TEST(ProcessTest, CaptureOutputTest) {
    auto outcome = sh("echo hello; echo world >&2");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_data, "hello\n");
    EXPECT_EQ(outcome.stderr_data, "world\n");
    EXPECT_GE(outcome.duration_ms, 0);
}

TEST(ProcessTest, StdinTest) {
    run_options options;
    options.input = "1 2\n";
    auto outcome = run_process("cat", {}, options);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "1 2\n");
}

TEST(ProcessTest, EmptyStdinTest) {
    // 没有输入时标准输入立即关闭，cat 不会阻塞
    auto outcome = run_process("cat", {}, run_options());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_data, "");
}

TEST(ProcessTest, LargeInputOutputTest) {
    // 远大于管道缓冲区，读写交替进行才不会死锁
    run_options options;
    options.input = string(4 << 20, 'x');
    options.timeout = chrono::milliseconds(10000);
    auto outcome = run_process("cat", {}, options);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data.size(), options.input.size());
}

TEST(ProcessTest, ExitCodeTest) {
    EXPECT_EQ(sh("exit 3").exit_code, 3);
    EXPECT_EQ(sh("kill -s SEGV $$").exit_code, 128 + 11);
}

TEST(ProcessTest, TimeoutTest) {
    run_options options;
    options.timeout = chrono::milliseconds(300);
    auto outcome = sh("echo partial; sleep 10", options);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_data, "partial\n");
    EXPECT_GE(outcome.duration_ms, 300);
    EXPECT_LT(outcome.duration_ms, 3000);
}

TEST(ProcessTest, TimeoutKillsProcessGroupTest) {
    // 后台进程持有输出管道，必须杀死整个进程组才能结束
    run_options options;
    options.timeout = chrono::milliseconds(300);
    auto outcome = sh("sleep 10 & sleep 10", options);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_LT(outcome.duration_ms, 3000);
}

/**
 * @brief 进程不存在或者已经成为僵尸进程
 */
static bool process_gone(const string &pid) {
    string stat = read_file_content(fs::path("/proc") / pid / "stat");
    if (stat.empty()) return true;
    auto state = stat.find(") ");
    return state != string::npos && stat[state + 2] == 'Z';
}

TEST(ProcessTest, ExitKillsBackgroundProcessTest) {
    // 子进程正常退出后，它留在进程组中的后台进程同样被杀死
    fs::path dir = test::make_temp_directory("process");
    run_options options;
    options.cwd = dir;
    options.timeout = chrono::milliseconds(5000);
    auto outcome = sh("sleep 10 > /dev/null 2>&1 & echo $! > pid; echo done", options);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "done\n");

    string pid = read_file_content(dir / "pid");
    while (!pid.empty() && isspace((unsigned char)pid.back())) pid.pop_back();
    ASSERT_FALSE(pid.empty());
    bool gone = false;
    for (int i = 0; i < 100 && !gone; ++i) {
        gone = process_gone(pid);
        if (!gone) this_thread::sleep_for(chrono::milliseconds(20));
    }
    EXPECT_TRUE(gone);
    fs::remove_all(dir);
}

TEST(ProcessTest, MissingExecutableTest) {
    auto outcome = run_process("/nonexistent/compiler", {"main.cpp"}, run_options());
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_NE(outcome.stderr_data.find("unable to start command /nonexistent/compiler"), string::npos);
}

TEST(ProcessTest, MissingCommandInPathTest) {
    auto outcome = run_process("starjudge-no-such-command", {}, run_options());
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_FALSE(outcome.stderr_data.empty());
}

TEST(ProcessTest, WorkingDirectoryTest) {
    fs::path dir = test::make_temp_directory("process");
    run_options options;
    options.cwd = dir;
    auto outcome = sh("pwd", options);
    EXPECT_EQ(outcome.stdout_data, fs::canonical(dir).string() + "\n");

    options.cwd = dir / "missing";
    auto missing = sh("pwd", options);
    EXPECT_EQ(missing.exit_code, -1);
    EXPECT_NE(missing.stderr_data.find("unable to change directory"), string::npos);
    fs::remove_all(dir);
}

TEST(ProcessTest, EnvironmentTest) {
    set_env("STARJUDGE_INHERITED", "parent");
    run_options options;
    options.env["STARJUDGE_EXTRA"] = "child";
    auto outcome = sh("echo $STARJUDGE_INHERITED $STARJUDGE_EXTRA", options);
    EXPECT_EQ(outcome.stdout_data, "parent child\n");
}

TEST(ProcessTest, OutputLimitTest) {
    run_options options;
    options.output_limit = 1000;
    auto outcome = sh("head -c 100000 /dev/zero", options);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data.size(), 1000u);
}

TEST(ProcessTest, ChildIgnoringStdinTest) {
    // 子进程不读取标准输入就退出，写入时不能因为 SIGPIPE 崩溃
    run_options options;
    options.input = string(1 << 20, 'x');
    auto outcome = sh("exit 0", options);
    EXPECT_EQ(outcome.exit_code, 0);
}
