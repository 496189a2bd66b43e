#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "common/messages.hpp"

namespace dcx::master {

/**
 * @brief master 记录的 worker 状态
 */
struct worker {
    std::string id;
    std::string address;
    int capacity = 0;

    /**
     * @brief 还能接收多少个提交，分配时立刻减少，不会小于 0，不会超过 capacity
     */
    int available_slots = 0;

    /**
     * @brief 分配给这个 worker 且还没有结束的提交
     */
    std::set<std::string> jobs;

    /**
     * @brief 已经分配、等待 worker 拉取的任务
     */
    std::vector<message::assignment> outbox;

    std::chrono::steady_clock::time_point last_heartbeat;
};

/**
 * @brief 被驱逐的 worker 及其未完成的提交
 */
struct evicted_worker {
    std::string id;
    std::set<std::string> jobs;
};

/**
 * @brief 线程安全的 worker 表，以 worker 编号为键
 * worker 的加入与离开都是动态的，超过心跳时限的 worker 会被驱逐。
 */
struct worker_registry {
    /**
     * @brief 注册 worker
     * 相同编号的 worker 重新注册时（比如 worker 重启），旧的记录被替换
     * @return 被替换的旧记录中还未完成的提交，需要重新分配
     */
    std::set<std::string> register_worker(const message::worker_registration &reg);

    /**
     * @brief 刷新 worker 的心跳时间
     * @return worker 不存在时返回 false
     */
    bool heartbeat(const std::string &worker_id);

    bool contains(const std::string &worker_id) const;

    /**
     * @brief 为提交挑选一个 worker 并占用一个空闲位置
     * 挑选空闲位置最多的 worker，相同时选择编号最小的
     * @return 选中的 worker 编号，没有空闲 worker 时返回空
     */
    std::optional<std::string> acquire_slot(const std::string &job_id);

    /**
     * @brief 将任务放入 worker 的待拉取列表
     * @return worker 已经不存在或者已经不再持有该提交时返回 false
     */
    bool deliver(const std::string &worker_id, const message::assignment &task);

    /**
     * @brief 取出 worker 所有待拉取的任务，同时刷新心跳时间
     * @return worker 不存在时返回空
     */
    std::optional<std::vector<message::assignment>> take_assignments(const std::string &worker_id);

    /**
     * @brief 提交结束或者被重新分配时释放 worker 上的位置
     * worker 不存在或者没有持有该提交时不做任何事
     */
    void release_slot(const std::string &worker_id, const std::string &job_id);

    /**
     * @brief 驱逐超过 timeout 没有心跳的 worker
     */
    std::vector<evicted_worker> evict_expired(std::chrono::milliseconds timeout);

    /**
     * @brief 所有 worker 的快照，按编号排序
     */
    std::vector<message::worker_info> snapshot() const;

private:
    mutable std::mutex mut;
    std::map<std::string, worker> workers;
};

}  // namespace dcx::master
