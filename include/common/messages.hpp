#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * master 与 worker 之间、master 与客户端之间传递的消息
 * 每个消息类型都提供 nlohmann::json 的 to_json/from_json
 */
namespace dcx::message {

/**
 * @brief 测试点
 * 提交之后不会再被修改
 */
struct test_case {
    /**
     * @brief 测试点编号，由客户端提供，在同一个提交中唯一
     */
    std::string id;

    /**
     * @brief 选手程序的标准输入
     */
    std::string input;

    /**
     * @brief 标准输出，和选手程序的 stdout 逐字节比较
     */
    std::string expected_output;
};

/**
 * @brief 一个测试点的评测结果
 */
struct verdict {
    std::string test_case_id;

    outcome result = outcome::INTERNAL_ERROR;

    /**
     * @brief 选手程序的 stdout，超过 OUTPUT_LIMIT_BYTES 的部分被截断
     */
    std::string actual_output;

    /**
     * @brief 选手程序的 stderr，编译错误时为编译器的输出
     */
    std::string stderr_output;

    /**
     * @brief 程序的返回值，被信号杀死时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 程序运行的墙上时间（毫秒）
     */
    int64_t duration_ms = 0;

    /**
     * @brief 程序运行的内存峰值（MB），无法获得时为 0
     */
    double peak_memory_mb = 0;
};

/**
 * @brief master 派发给 worker 的评测任务
 */
struct assignment {
    std::string job_id;

    /**
     * @brief 第几次分配，从 1 开始
     * worker 上报的所有消息都必须带上这个值，过期的上报会被 master 拒绝
     */
    int attempt = 0;

    std::string language;
    std::string source_code;
    std::vector<test_case> test_cases;
    int time_limit_ms = 0;
    int memory_limit_mb = 0;
};

/**
 * @brief worker 启动时向 master 注册自身
 */
struct worker_registration {
    std::string id;
    std::string address;
    int capacity = 0;
};

/**
 * @brief /workers 返回的 worker 快照
 */
struct worker_info {
    std::string id;
    std::string address;
    int capacity = 0;
    int available_slots = 0;
    int running_jobs = 0;

    /**
     * @brief 距离上一次心跳的毫秒数
     */
    int64_t last_heartbeat_ms = 0;
};

/**
 * @brief worker 上报提交的进度
 */
struct job_progress {
    std::string worker_id;
    int attempt = 0;

    /**
     * @brief 只能是 compiling 或 running
     */
    job_status status = job_status::RUNNING;
};

/**
 * @brief worker 上报的一批测试点评测结果
 */
struct verdict_batch {
    std::string worker_id;
    int attempt = 0;
    std::optional<std::string> compiler_output;
    std::vector<verdict> verdicts;
};

/**
 * @brief worker 对提交的确认、完成、失败上报
 * reason 仅在失败时有意义
 */
struct job_report {
    std::string worker_id;
    int attempt = 0;
    std::string reason;
};

void to_json(nlohmann::json &j, const test_case &value);
void from_json(const nlohmann::json &j, test_case &value);
void to_json(nlohmann::json &j, const verdict &value);
void from_json(const nlohmann::json &j, verdict &value);
void to_json(nlohmann::json &j, const assignment &value);
void from_json(const nlohmann::json &j, assignment &value);
void to_json(nlohmann::json &j, const worker_registration &value);
void from_json(const nlohmann::json &j, worker_registration &value);
void to_json(nlohmann::json &j, const worker_info &value);
void from_json(const nlohmann::json &j, worker_info &value);
void to_json(nlohmann::json &j, const job_progress &value);
void from_json(const nlohmann::json &j, job_progress &value);
void to_json(nlohmann::json &j, const verdict_batch &value);
void from_json(const nlohmann::json &j, verdict_batch &value);
void to_json(nlohmann::json &j, const job_report &value);
void from_json(const nlohmann::json &j, job_report &value);

}  // namespace dcx::message
