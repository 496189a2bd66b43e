#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace dcx {

/**
 * @brief 表示整个提交的状态
 * pending → assigned → (compiling) → running → completed，
 * 基础设施出错且重试次数耗尽时为 failed
 */
enum class job_status {
    /**
     * @brief 提交在等待队列中，还未分配给 worker
     */
    PENDING = 0,

    /**
     * @brief 提交已经分配给 worker，等待 worker 确认
     */
    ASSIGNED = 1,

    /**
     * @brief worker 正在编译选手程序
     * 解释型语言不会进入该状态
     */
    COMPILING = 2,

    /**
     * @brief worker 正在运行测试点
     */
    RUNNING = 3,

    /**
     * @brief 所有测试点都有了评测结果
     * 即使所有测试点都没有通过也是 completed
     */
    COMPLETED = 4,

    /**
     * @brief 评测系统内部错误导致提交无法完成评测
     */
    FAILED = 5
};

/**
 * @brief 表示单个测试点的评测结果
 */
enum class outcome {
    ACCEPTED = 0,

    /**
     * @brief 程序正常退出，但 stdout 与标准输出不是逐字节相同
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 选手程序无法通过编译，该提交所有测试点都是这个结果
     */
    COMPILE_ERROR = 2,

    /**
     * @brief 程序返回值非 0，或者因为信号崩溃（比如段错误）
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 程序运行时间（墙上时间）超出限制，进程组已被杀死
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 程序内存使用超出了 cgroup 或者容器的内存上限而被 OOM killer 杀死
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 沙箱本身无法启动或者执行出错
     * 该结果不会作为测试点的评测结果保存，而是触发重试
     */
    INTERNAL_ERROR = 6
};

const char *get_display_message(job_status stat);
const char *get_display_message(outcome result);

/**
 * @throw std::invalid_argument 不认识的状态字符串
 */
job_status parse_job_status(const std::string &str);

/**
 * @throw std::invalid_argument 不认识的评测结果字符串
 */
outcome parse_outcome(const std::string &str);

/**
 * @brief 提交是否已经处于终止状态（completed 或 failed）
 */
bool is_terminal(job_status stat);

void to_json(nlohmann::json &j, job_status stat);
void from_json(const nlohmann::json &j, job_status &stat);
void to_json(nlohmann::json &j, outcome result);
void from_json(const nlohmann::json &j, outcome &result);

}  // namespace dcx
