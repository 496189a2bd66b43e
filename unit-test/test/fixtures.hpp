#pragma once

#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "language/profile.hpp"
#include "sandbox/sandbox.hpp"

namespace dcx::test {

/**
 * @brief 测试使用的运行目录，每个测试进程独立
 * 设置了环境变量 CGROUPROOT 时，进程沙箱的测试使用该 cgroup 限制内存
 */
inline void setup_test_environment() {
    if (getenv("DEBUG")) dcx::DEBUG = true;
    if (getenv("CGROUPROOT")) dcx::CGROUP_ROOT = getenv("CGROUPROOT");
    dcx::RUN_DIR = std::filesystem::temp_directory_path() / ("dcx-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(dcx::RUN_DIR);
}

/**
 * @brief 基于 /bin/sh 的语言，不依赖任何编译器和 docker 镜像
 * sh: 直接解释执行 main.sh
 * shc: 用 sh -n 检查语法作为编译步骤，编译产物为 prog.sh
 */
inline std::shared_ptr<const language::registry> shell_languages() {
    language::profile sh{"sh", "main.sh", std::nullopt, "sh main.sh", std::nullopt, "debian:bookworm-slim",
                         DEFAULT_COMPILE_TIME_LIMIT_MS, DEFAULT_COMPILE_MEMORY_LIMIT_MB};
    language::profile shc{"shc", "main.sh", std::string("sh -n main.sh && cp main.sh prog.sh"), "sh prog.sh",
                          std::string("debian:bookworm-slim"), "debian:bookworm-slim",
                          5000, 256};
    return std::make_shared<const language::registry>(std::vector<language::profile>{sh, shc});
}

/**
 * @brief 内置语言加上 shell_languages 中的测试语言
 */
inline std::shared_ptr<const language::registry> builtin_and_shell_languages() {
    std::vector<language::profile> profiles;
    for (auto reg : {language::registry::builtin(), shell_languages()})
        for (auto &id : reg->languages())
            profiles.push_back(*reg->find(id));
    return std::make_shared<const language::registry>(profiles);
}

/**
 * @brief 由测试决定每次执行结果的沙箱，同时统计并发度
 */
struct scripted_sandbox : public sandbox::sandbox {
    std::function<sandbox::result(const sandbox::request &)> script;

    std::atomic<int> executions{0};
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};

    explicit scripted_sandbox(std::function<sandbox::result(const sandbox::request &)> script)
        : script(std::move(script)) {}

    std::string type() const override {
        return "scripted";
    }

protected:
    void execute(const sandbox::request &req, const std::filesystem::path &, sandbox::result &res) override {
        ++executions;
        int now = ++running;
        int prev = max_running.load();
        while (now > prev && !max_running.compare_exchange_weak(prev, now)) {
        }
        defer { --running; };
        res = script(req);
    }
};

/**
 * @brief 正常退出并输出 output 的执行结果
 */
inline sandbox::result exited(const std::string &output, int exit_code = 0) {
    sandbox::result res;
    res.exit_code = exit_code;
    res.stdout_output = output;
    res.duration_ms = 1;
    return res;
}

}  // namespace dcx::test
