#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "config.hpp"

namespace dcx::sandbox {

/**
 * @brief 启动一个受控子进程的参数
 */
struct process_options {
    /**
     * @brief 外部命令的路径 (argv[0]) 和 参数
     */
    std::vector<std::string> argv;

    /**
     * @brief 子进程的工作目录，为空时继承父进程
     */
    std::filesystem::path workdir;

    /**
     * @brief 写入子进程 stdin 的内容，写完后关闭 stdin
     */
    std::string input;

    /**
     * @brief 墙上时间限制，到时后杀死整个进程组。为 0 时不限制
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout、stderr 各自最多保存的字节数
     */
    std::size_t output_limit = OUTPUT_LIMIT_BYTES;

    /**
     * @brief 子进程是否放入新的网络、IPC、UTS 命名空间，需要 root 权限
     */
    bool isolate_namespaces = false;

    /**
     * @brief 子进程的虚拟地址空间上限 (RLIMIT_AS，字节)，为 0 时不限制
     */
    int64_t address_space_limit = 0;

    /**
     * @brief 子进程 fork 之后、exec 之前在父进程中执行，此时子进程处于等待状态
     * 用于将子进程加入 cgroup，抛出异常时子进程会被杀死
     */
    std::function<void(pid_t)> before_exec;
};

struct process_result {
    /**
     * @brief 子进程的返回值，被信号杀死时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 杀死子进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 是否因为超过了墙上时间限制而被杀死
     */
    bool timed_out = false;

    std::string stdout_output;
    std::string stderr_output;

    /**
     * @brief 从 fork 到子进程退出的墙上时间
     */
    int64_t duration_ms = 0;

    /**
     * @brief 子进程及其已回收的后代进程中最大的常驻内存（KB）
     */
    long max_rss_kb = 0;
};

/**
 * @brief 运行子进程，等待其退出并收集输出
 * 子进程运行在独立的进程组中，退出或超时后整个进程组都会被杀死。
 * 调用方需要忽略 SIGPIPE，否则子进程不读 stdin 就退出时写管道会杀死当前进程。
 * @throw internal_error 无法创建管道、无法 fork、无法 exec
 */
process_result run_process(const process_options &opt);

}  // namespace dcx::sandbox
