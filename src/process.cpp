#include "starjudge/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <mutex>
#include "starjudge/common/defer.hpp"
#include "starjudge/common/exceptions.hpp"
#include "starjudge/common/utils.hpp"
#include "starjudge/config.hpp"

namespace starjudge {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_OUT = 0;
const int PIPE_IN = 1;

const size_t BUF_SIZE = 4096;

/**
 * @brief 在一次轮询中最多等待的时间
 * 轮询结束后会检查子进程是否已经退出
 */
const int POLL_INTERVAL_MS = 10;

// 子进程通过 exec 错误管道报告的失败阶段
const int STAGE_CHDIR = 1;
const int STAGE_EXEC = 2;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&... args) {
    throw process_error(fmt::format(fmt::runtime(format), forward<Args>(args)...) + ": " + strerror(err));
}

run_options::run_options()
    : output_limit(OUTPUT_LIMIT) {}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0 && errno != EINTR)
        LOG(WARNING) << "closing fd " << fd << ": " << strerror(errno);
    fd = -1;
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

static void ignore_sigpipe() {
    // 选手程序提前退出时，向标准输入写数据会触发 SIGPIPE
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

/**
 * @brief 从管道读取数据，超出 limit 的部分读取后丢弃
 * @return 管道是否已经关闭（读到 EOF）
 */
static bool pump_pipe(int fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            if (buffer.size() < limit)
                buffer.append(buf, min((size_t)nread, limit - buffer.size()));
            continue;
        }
        if (nread == 0) return true;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
        error(errno, "reading output of child");
    }
}

/**
 * @brief 尽可能多地向子进程写入标准输入
 * @return 标准输入是否已经写完或者子进程不再读取
 */
static bool pump_input(int fd, const string &input, size_t &written) {
    while (written < input.size()) {
        ssize_t n = write(fd, input.data() + written, min(BUF_SIZE * 16, input.size() - written));
        if (n > 0) {
            written += n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return false;
        if (n < 0 && errno == EPIPE) return true;  // 子进程已经关闭了标准输入
        error(errno, "writing input of child");
    }
    return true;
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    return status;
}

static int decode_exit_code(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    // Linux 中正常的返回值不会超过 127
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    if (WIFSTOPPED(status)) return 128 + WSTOPSIG(status);
    throw process_error(fmt::format("unknown status: {:x}", status));
}

execution_outcome run_process(const fs::path &executable, const vector<string> &args, const run_options &options) {
    ignore_sigpipe();

    // fork 之后子进程只能调用异步信号安全的函数，因此参数和环境变量在 fork 前准备好
    vector<string> cmd;
    cmd.push_back(executable.string());
    cmd.insert(cmd.end(), args.begin(), args.end());
    vector<string> env = build_environment(options.env);

    vector<char *> argv, envp;
    for (auto &arg : cmd) argv.push_back(arg.data());
    argv.push_back(nullptr);
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);
    string cwd = options.cwd.string();

#ifndef NDEBUG
    LOG(INFO) << "Running " << boost::algorithm::join(cmd, " ") << " in " << (cwd.empty() ? "." : cwd);
#endif

    // 0: stdin, 1: stdout, 2: stderr, 3: exec 错误
    int child_pipefd[4][2];
    for (auto &fds : child_pipefd) fds[0] = fds[1] = -1;
    defer {
        for (auto &fds : child_pipefd) {
            close_fd(fds[PIPE_OUT]);
            close_fd(fds[PIPE_IN]);
        }
    };

    // O_CLOEXEC 保证并发启动的其他子进程不会继承这些管道
    for (int i = 0; i < 4; ++i)
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);

    pid_t child_pid = fork();
    if (child_pid < 0) error(errno, "unable to fork");

    if (child_pid == 0) {  // child process, run the command
        setpgid(0, 0);
        if (dup2(child_pipefd[0][PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) < 0)
            _exit(127);
        signal(SIGPIPE, SIG_DFL);

        int report[2] = {STAGE_CHDIR, 0};
        if (cwd.empty() || chdir(cwd.c_str()) == 0) {
            report[0] = STAGE_EXEC;
            execvpe(argv[0], argv.data(), envp.data());
        }
        report[1] = errno;
        ssize_t ignored = write(child_pipefd[3][PIPE_IN], report, sizeof(report));
        (void)ignored;
        _exit(127);
    }

    // watchdog
    setpgid(child_pid, child_pid);
    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-child_pid, SIGKILL);
            int status;
            while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {}
        }
    };

    for (int i = 0; i < 4; ++i)
        close_fd(child_pipefd[i][i == 0 ? PIPE_OUT : PIPE_IN]);

    execution_outcome outcome;
    elapsed_time timer;

    // exec 成功时，管道因 O_CLOEXEC 被关闭，这里读到 EOF
    int report[2];
    ssize_t nread;
    while ((nread = read(child_pipefd[3][PIPE_OUT], report, sizeof(report))) < 0 && errno == EINTR) {}
    close_fd(child_pipefd[3][PIPE_OUT]);
    if (nread == (ssize_t)sizeof(report)) {
        wait_child(child_pid);
        reaped = true;
        if (report[0] == STAGE_CHDIR)
            outcome.stderr_data = fmt::format("unable to change directory to {}: {}", cwd, strerror(report[1]));
        else
            outcome.stderr_data = fmt::format("unable to start command {}: {}", executable, strerror(report[1]));
        outcome.exit_code = -1;
        LOG(WARNING) << outcome.stderr_data;
        return outcome;
    }

    int &stdin_fd = child_pipefd[0][PIPE_IN];
    int &stdout_fd = child_pipefd[1][PIPE_OUT];
    int &stderr_fd = child_pipefd[2][PIPE_OUT];
    set_nonblock(stdin_fd);
    set_nonblock(stdout_fd);
    set_nonblock(stderr_fd);

    size_t written = 0;
    if (options.input.empty()) close_fd(stdin_fd);

    auto deadline = chrono::steady_clock::now() + options.timeout;
    while (true) {
        // 子进程自然退出和超时都在这里结束循环。WNOWAIT 不回收子进程，
        // 子进程成为僵尸进程期间进程组号不会被其他进程复用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0 && errno != EINTR)
            error(errno, "waiting on child");
        if (info.si_pid == child_pid) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_fd >= 0) fds[nfds++] = {stdin_fd, POLLOUT, 0};
        if (stdout_fd >= 0) fds[nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[nfds++] = {stderr_fd, POLLIN, 0};

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
        int wait_ms = (int)max<long long>(1, min<long long>(remaining, POLL_INTERVAL_MS));
        if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR) error(errno, "waiting for child data");

        if (stdin_fd >= 0 && pump_input(stdin_fd, options.input, written)) close_fd(stdin_fd);
        if (stdout_fd >= 0 && pump_pipe(stdout_fd, outcome.stdout_data, options.output_limit)) close_fd(stdout_fd);
        if (stderr_fd >= 0 && pump_pipe(stderr_fd, outcome.stderr_data, options.output_limit)) close_fd(stderr_fd);
    }
    outcome.duration_ms = timer.duration<chrono::milliseconds>().count();

    // 超时时杀死子进程；子进程已经退出时杀死它留下的后台进程，否则它们持有的管道永远不会关闭。
    // 此时子进程还没有被回收，进程组一定仍然属于它
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
    int status = wait_child(child_pid);
    reaped = true;

    // 读取子进程退出前写入管道的剩余数据
    if (stdout_fd >= 0) pump_pipe(stdout_fd, outcome.stdout_data, options.output_limit);
    if (stderr_fd >= 0) pump_pipe(stderr_fd, outcome.stderr_data, options.output_limit);

    outcome.exit_code = decode_exit_code(status);
    if (outcome.timed_out)
        LOG(INFO) << "Command " << executable << " killed after " << outcome.duration_ms << "ms (time limit exceeded)";
    else if (WIFSIGNALED(status))
        LOG(INFO) << "Command " << executable << " terminated with signal (" << WTERMSIG(status) << ", " << strsignal(WTERMSIG(status)) << ")";
    return outcome;
}

}  // namespace starjudge
