#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <cstring>
#include <mutex>
#include "common/exceptions.hpp"

namespace dcx {
using namespace std;

int exec_program(const vector<string> &args) {
    vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw internal_error(fmt::format("unable to fork for {}: {}", args[0], strerror(errno)));
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            execvp(argv[0], argv.data());
            _exit(127);
        }
        default: {  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw internal_error(fmt::format("waiting for {}: {}", args[0], strerror(errno)));
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
        }
    }
}

string generate_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

int64_t now_millis() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

elapsed_time::elapsed_time() : start(chrono::steady_clock::now()) {}

int64_t elapsed_time::millis() const {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
}

}  // namespace dcx
