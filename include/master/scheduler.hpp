#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include "master/job_store.hpp"
#include "master/worker_registry.hpp"

namespace dcx::master {

struct scheduler_config {
    /**
     * @brief worker 需要在这个时间内确认分配，否则提交被重新分配
     */
    std::chrono::milliseconds ack_timeout{5000};

    /**
     * @brief worker 超过这个时间没有心跳就会被驱逐
     */
    std::chrono::milliseconds heartbeat_timeout{10000};

    /**
     * @brief 一个提交最多被分配几次，超过后提交失败
     */
    int max_attempts = 3;

    /**
     * @brief 检查超时的周期
     */
    std::chrono::milliseconds tick{200};

    /**
     * @brief 已经结束的提交保留多久
     */
    std::chrono::seconds job_retention{3600};
};

/**
 * @brief 将等待中的提交分配给 worker
 * 等待队列按照提交顺序先进先出，重新进入队列的提交保持原来的位置。
 * 调度线程在提交、worker 注册、位置释放时被唤醒，并且周期性地检查
 * 确认超时、心跳超时、过期提交。
 *
 * 加锁顺序为 scheduler → registry → store → job。
 */
struct scheduler {
    scheduler(job_store &store, worker_registry &registry, scheduler_config config = {});
    ~scheduler();

    /**
     * @brief 启动调度线程
     */
    void start();

    /**
     * @brief 停止调度线程并等待其退出
     */
    void stop();

    /**
     * @brief 将提交加入等待队列
     */
    void enqueue(const std::shared_ptr<job> &j);

    /**
     * @brief 唤醒调度线程，比如有新的 worker 注册或者 worker 释放了位置
     */
    void notify();

    /**
     * @brief 依次将队头的提交分配给空闲的 worker，直到队列为空或者没有空闲的 worker
     * @return 分配的提交数
     */
    std::size_t dispatch();

    /**
     * @brief 处理确认超时、心跳超时和过期提交
     */
    void check_timeouts();

    /**
     * @brief 提交的第 attempt 次分配失败
     * 释放 worker 上的位置。若所有测试点都已经有了结果，提交完成；
     * 若还没有达到最大分配次数，提交重新进入等待队列；否则提交失败。
     * attempt 已经过期时不做任何事。
     * @param reason 失败原因
     */
    void retry(const std::shared_ptr<job> &j, int attempt, const std::string &reason);

    /**
     * @brief 将被替换或被驱逐的 worker 上的提交重新分配
     */
    void reassign(const std::string &worker_id, const std::set<std::string> &job_ids, const std::string &reason);

    const scheduler_config &config() const;

    /**
     * @brief 等待队列的长度
     */
    std::size_t pending_size() const;

private:
    void loop();

    job_store &store;
    worker_registry &registry;
    scheduler_config cfg;

    mutable std::mutex mut;
    std::condition_variable cv;

    /**
     * @brief 等待队列，按 (提交序号, 提交编号) 排序
     */
    std::set<std::pair<uint64_t, std::string>> pending;

    bool woken = false;
    bool stopping = false;
    std::thread thread;
};

}  // namespace dcx::master
