#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace dcx {

inline std::string command_arg(const std::string &arg) {
    return arg;
}

inline std::string command_arg(const char *arg) {
    return arg;
}

inline std::string command_arg(const std::filesystem::path &arg) {
    return arg.string();
}

template <typename T>
std::string command_arg(const T &arg) {
    return boost::lexical_cast<std::string>(arg);
}

/**
 * @brief 执行外部命令，等待其结束
 * 子进程的标准输出和标准错误被丢弃，需要输出的场合请使用 run_process
 * @param argv argv[0] 为命令名，在 PATH 中查找
 * @return 命令的退出码，被信号杀死时返回 -1
 * @throw internal_error 无法创建子进程
 */
int exec_program(const std::vector<std::string> &argv);

/**
 * @brief 以参数列表的形式调用外部命令，参数不经过 shell
 * @code{.cpp}
 *     int exitcode = call_process(DOCKER_BIN, "rm", "-f", container);
 * @endcode
 */
template <typename... Args>
int call_process(const Args &... args) {
    std::vector<std::string> argv{command_arg(args)...};
    DLOG(INFO) << boost::algorithm::join(argv, " ");
    return exec_program(argv);
}

/**
 * @brief 生成随机 UUID，用于提交编号、worker 编号以及容器名
 */
std::string generate_uuid();

/**
 * @brief 当前时间距离 epoch 的毫秒数，用于对外展示的时间戳
 */
int64_t now_millis();

/**
 * @brief 计时器，从构造时开始计时
 */
struct elapsed_time {
    elapsed_time();

    int64_t millis() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace dcx
