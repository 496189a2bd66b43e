#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "common/status.hpp"

namespace dcx::sandbox {

/**
 * @brief 一次编译或运行的请求
 */
struct request {
    /**
     * @brief 由 sh -c 执行的命令
     */
    std::string command;

    /**
     * @brief 提交的运行目录，包含源代码和编译产物
     */
    std::filesystem::path workdir;

    /**
     * @brief docker 沙箱使用的镜像，process 沙箱忽略
     */
    std::string image;

    int time_limit_ms = 0;
    int memory_limit_mb = 0;

    /**
     * @brief 程序的标准输入
     */
    std::optional<std::string> input;

    /**
     * @brief 是否直接在 workdir 中执行
     * 编译需要将产物留在 workdir 中，因此为 true；
     * 每个测试点的运行使用 workdir 的一个全新拷贝，运行结束后删除，因此为 false。
     */
    bool in_place = false;
};

/**
 * @brief 一次执行的原始结果，还没有和标准输出比较
 */
struct result {
    /**
     * @brief 沙箱自身出错的原因，为空表示程序确实被执行了
     */
    std::string error;

    int exit_code = 0;

    /**
     * @brief 杀死程序的信号，为 0 表示程序正常退出
     */
    int signal = 0;

    /**
     * @brief 程序运行超过了时间限制并被杀死
     */
    bool timed_out = false;

    /**
     * @brief 程序超过了内存限制
     */
    bool oom_killed = false;

    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_ms = 0;
    double peak_memory_mb = 0;

    bool ok() const;

    /**
     * @brief 作为编译步骤时，编译是否失败（返回值非 0、超时、内存超限）
     */
    bool compile_failed() const;
};

/**
 * @brief 根据执行结果判定测试点的评测结果
 * 按以下顺序，第一个满足的条件决定结果：
 * 1. 编译失败 → compile_error
 * 2. 内存超限 → memory_limit_exceeded
 * 3. 超时 → time_limit_exceeded
 * 4. 返回值非 0 或者被信号杀死 → runtime_error
 * 5. stdout 与 expected_output 不是逐字节相同 → wrong_answer
 * 6. 否则 accepted
 * 沙箱自身出错时返回 internal_error。
 */
outcome classify(const result &res, const std::string &expected_output, bool compile_failed = false);

/**
 * @brief 沙箱，每次执行都在一个全新的环境中进行
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 沙箱的类型，docker 或 process
     */
    virtual std::string type() const = 0;

    /**
     * @brief 执行一次编译或运行
     * 准备运行目录、调用 execute、无条件清理运行目录。
     * 这个函数不会抛出异常，沙箱出错时返回 error 不为空的结果。
     */
    result run(const request &req);

protected:
    /**
     * @brief 在 dir 中执行命令，填写 res
     * 实现负责清理自己创建的资源（进程、容器、cgroup）
     * @param req 请求
     * @param dir 实际执行命令的目录
     * @throw internal_error 沙箱无法启动或者执行出错
     */
    virtual void execute(const request &req, const std::filesystem::path &dir, result &res) = 0;
};

/**
 * @brief 根据类型创建沙箱
 * @param type docker 或 process
 * @throw std::invalid_argument 不认识的沙箱类型
 */
std::unique_ptr<sandbox> make_sandbox(const std::string &type);

}  // namespace dcx::sandbox
