#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/messages.hpp"
#include "common/status.hpp"

namespace dcx::master {

/**
 * @brief 一个提交
 * language、source_code、test_cases、限制、编号、时间戳在创建后不会被修改，可以不加锁读取；
 * 其余字段由 mut 保护。
 */
struct job {
    std::string id;

    /**
     * @brief 提交的序号，用于维持等待队列的先进先出顺序
     * 重新进入等待队列的提交保持原来的位置
     */
    uint64_t sequence = 0;

    std::string language;
    std::string source_code;
    std::vector<message::test_case> test_cases;
    int time_limit_ms = 0;
    int memory_limit_mb = 0;

    /**
     * @brief 提交时间，距离 epoch 的毫秒数
     */
    int64_t created_at = 0;

    mutable std::mutex mut;

    job_status status = job_status::PENDING;

    /**
     * @brief 以测试点编号为键的评测结果，每个键只能写入一次
     */
    std::unordered_map<std::string, message::verdict> verdicts;

    std::optional<std::string> compiler_output;

    /**
     * @brief 提交失败的原因
     */
    std::string error;

    /**
     * @brief 已经分配的次数，也是当前分配的编号
     */
    int attempts = 0;

    /**
     * @brief 当前分配到的 worker，没有分配时为空
     */
    std::string worker_id;

    /**
     * @brief worker 是否已经确认了当前分配
     */
    bool acknowledged = false;

    std::chrono::steady_clock::time_point assigned_at;

    /**
     * @brief 进入终止状态的时间，用于过期清理
     */
    std::chrono::steady_clock::time_point finished_at;

    int64_t updated_at = 0;

    /**
     * @brief 记录评测结果，调用方需要持有 mut
     * @return 是否写入，同一测试点已经有结果时返回 false
     * @throw bad_request 测试点编号不属于这个提交
     */
    bool record_verdict(const message::verdict &v);

    /**
     * @brief 是否每一个测试点都有了评测结果，调用方需要持有 mut
     */
    bool all_verdicts_recorded() const;

    /**
     * @brief 还没有评测结果的测试点，调用方需要持有 mut
     */
    std::vector<message::test_case> missing_test_cases() const;

    /**
     * @brief 修改状态并更新时间戳，调用方需要持有 mut
     */
    void set_status(job_status next);
};

/**
 * @brief 保存所有提交的内存数据库
 * 只有提交表本身由 store 的锁保护，提交内部的状态由每个提交自己的锁保护，
 * 因此不同提交的评测结果可以并发写入。
 */
struct job_store {
    /**
     * @brief 创建一个新的等待中的提交
     * @return 新提交，编号为随机 UUID
     */
    std::shared_ptr<job> create(const std::string &language, const std::string &source_code,
                                std::vector<message::test_case> test_cases,
                                int time_limit_ms, int memory_limit_mb);

    /**
     * @return 提交不存在时返回 nullptr
     */
    std::shared_ptr<job> find(const std::string &id) const;

    /**
     * @brief 所有提交的快照
     */
    std::vector<std::shared_ptr<job>> all() const;

    /**
     * @brief 删除进入终止状态超过 retention 的提交
     * @return 删除的提交数
     */
    std::size_t purge(std::chrono::seconds retention);

    std::size_t size() const;

private:
    mutable std::mutex mut;
    uint64_t next_sequence = 0;
    std::unordered_map<std::string, std::shared_ptr<job>> jobs;
};

}  // namespace dcx::master
