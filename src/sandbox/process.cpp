#include "sandbox/process.hpp"
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace dcx::sandbox {
using namespace std;

const int PIPE_OUT = 0;
const int PIPE_IN = 1;

const int BUF_SIZE = 4096;

// 检查子进程是否退出的间隔
const int POLL_INTERVAL_MS = 10;

static internal_error system_failure(int err, const string &action) {
    return internal_error(action + ": " + strerror(err));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void make_pipe(int fds[2], const char *name) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_failure(errno, fmt::format("creating pipe for {}", name));
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_failure(errno, "fcntl, setting flags");
}

static int set_address_space(int64_t bytes) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = (rlim_t)bytes;
    return setrlimit(RLIMIT_AS, &lim);
}

/**
 * @brief fork 之后子进程执行的部分
 * 只能调用异步信号安全的函数。出错时将 errno 写入 errfd 并退出。
 */
[[noreturn]] static void exec_child(char *const argv[], const char *workdir, bool isolate, int64_t address_space,
                                    int infd, int outfd, int errfd, int gofd, int reportfd) {
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    // 独立的进程组，以便超时后杀死用户程序产生的所有进程
    setpgid(0, 0);

    int err = 0;
    char go;
    // 等待父进程完成准备工作（比如加入 cgroup）
    if (read(gofd, &go, 1) != 1) _exit(127);

    if (dup2(infd, STDIN_FILENO) < 0 ||
        dup2(outfd, STDOUT_FILENO) < 0 ||
        dup2(errfd, STDERR_FILENO) < 0) {
        err = errno;
    } else if (isolate && unshare(CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS) != 0) {
        err = errno;
    } else if (workdir && chdir(workdir) != 0) {
        err = errno;
    } else if (address_space > 0 && set_address_space(address_space) != 0) {
        err = errno;
    } else {
        struct rlimit lim = {0, 0};
        setrlimit(RLIMIT_CORE, &lim);
        execvp(argv[0], argv);
        err = errno;
    }

    ssize_t written = write(reportfd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

process_result run_process(const process_options &opt) {
    if (opt.argv.empty()) throw internal_error("empty command");

    vector<char *> argv;
    for (auto &arg : opt.argv)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = opt.workdir.string();

#ifndef NDEBUG
    stringstream ss;
    for (auto &arg : opt.argv)
        ss << arg << ' ';
    DLOG(INFO) << "Running " << ss.str() << "in " << opt.workdir;
#endif

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1};
    int go_pipe[2] = {-1, -1}, report_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, go_pipe, report_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    make_pipe(stdin_pipe, "stdin");
    make_pipe(stdout_pipe, "stdout");
    make_pipe(stderr_pipe, "stderr");
    make_pipe(go_pipe, "synchronization");
    make_pipe(report_pipe, "exec report");

    pid_t pid = fork();
    if (pid < 0) throw system_failure(errno, "unable to fork");
    if (pid == 0) {
        exec_child(argv.data(), workdir.empty() ? nullptr : workdir.c_str(), opt.isolate_namespaces, opt.address_space_limit,
                   stdin_pipe[PIPE_OUT], stdout_pipe[PIPE_IN], stderr_pipe[PIPE_IN],
                   go_pipe[PIPE_OUT], report_pipe[PIPE_IN]);
    }

    // 和子进程中的 setpgid 相同，避免父进程先执行 kill(-pid) 时进程组还不存在
    setpgid(pid, pid);

    bool reaped = false;
    int status = 0;
    struct rusage usage = {};
    defer {
        // 任何退出路径上都不能留下子进程
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };

    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(go_pipe[PIPE_OUT]);
    close_fd(report_pipe[PIPE_IN]);

    if (opt.before_exec) opt.before_exec(pid);

    if (write(go_pipe[PIPE_IN], "x", 1) != 1)
        throw system_failure(errno, "releasing child process");
    close_fd(go_pipe[PIPE_IN]);

    {
        int err = 0;
        ssize_t n;
        while ((n = read(report_pipe[PIPE_OUT], &err, sizeof(err))) < 0 && errno == EINTR)
            ;
        close_fd(report_pipe[PIPE_OUT]);
        if (n == sizeof(err))
            throw system_failure(err, fmt::format("unable to start command {}", opt.argv[0]));
    }

    elapsed_time elapsed;
    process_result res;

    int &in_fd = stdin_pipe[PIPE_IN];
    int &out_fd = stdout_pipe[PIPE_OUT];
    int &err_fd = stderr_pipe[PIPE_OUT];
    set_nonblock(out_fd);
    set_nonblock(err_fd);
    size_t input_written = 0;
    if (opt.input.empty())
        close_fd(in_fd);
    else
        set_nonblock(in_fd);

    auto deadline = chrono::steady_clock::now() + opt.timeout;
    chrono::steady_clock::time_point exit_time;
    char buf[BUF_SIZE];

    auto pump = [&](int &fd, string &dst) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            // 超出限制的部分直接丢弃，但仍然要读出来以免子进程阻塞
            if (dst.size() < opt.output_limit)
                dst.append(buf, min((size_t)nread, opt.output_limit - dst.size()));
        } else if (nread == 0) {
            close_fd(fd);
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw system_failure(errno, "reading output of child");
        }
    };

    while (true) {
        auto now = chrono::steady_clock::now();
        if (!reaped) {
            pid_t r = wait4(pid, &status, WNOHANG, &usage);
            if (r == pid) {
                reaped = true;
                res.duration_ms = elapsed.millis();
                exit_time = now;
                // 主进程退出后，杀死进程组中残留的后台进程
                if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                    LOG(WARNING) << "Unable to kill process group " << pid << ": " << strerror(errno);
                close_fd(in_fd);
            } else if (r < 0 && errno != EINTR) {
                throw system_failure(errno, "waiting on child");
            }
        }

        if (reaped && out_fd < 0 && err_fd < 0) break;
        if (reaped && now - exit_time > chrono::milliseconds(KILL_GRACE_MS)) {
            LOG(WARNING) << "Output pipes of " << opt.argv[0] << " are still held by escaped processes";
            break;
        }

        if (!reaped && opt.timeout.count() > 0 && !res.timed_out && now >= deadline) {
            res.timed_out = true;
            DLOG(INFO) << "Wall time limit exceeded, killing process group " << pid;
            if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                throw system_failure(errno, "sending SIGKILL to command");
        }

        struct pollfd fds[3];
        int nfds = 0;
        int *targets[3];
        for (int *fd : {&in_fd, &out_fd, &err_fd}) {
            if (*fd < 0) continue;
            fds[nfds].fd = *fd;
            fds[nfds].events = fd == &in_fd ? POLLOUT : POLLIN;
            fds[nfds].revents = 0;
            targets[nfds++] = fd;
        }

        int r = poll(fds, nfds, POLL_INTERVAL_MS);
        if (r < 0) {
            if (errno == EINTR) continue;
            throw system_failure(errno, "waiting for child data");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            int &fd = *targets[i];
            if (&fd == &in_fd) {
                ssize_t n = write(fd, opt.input.data() + input_written, opt.input.size() - input_written);
                if (n > 0) {
                    input_written += n;
                    if (input_written == opt.input.size()) close_fd(fd);
                } else if (n < 0 && errno == EPIPE) {
                    // 子进程不再读取 stdin
                    close_fd(fd);
                } else if (n < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    throw system_failure(errno, "writing input of child");
                }
            } else {
                pump(fd, &fd == &out_fd ? res.stdout_output : res.stderr_output);
            }
        }
    }

    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
        res.exit_code = 128 + res.signal;
    }
    res.max_rss_kb = usage.ru_maxrss;
    return res;
}

}  // namespace dcx::sandbox
