#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "common/messages.hpp"
#include "language/profile.hpp"
#include "sandbox/sandbox.hpp"
#include "worker/master_client.hpp"
#include "worker/slot_pool.hpp"

namespace dcx::worker {

struct agent_config {
    /**
     * @brief worker 编号，为空时随机生成
     */
    std::string worker_id;

    /**
     * @brief 展示在 /workers 中的地址
     */
    std::string address;

    /**
     * @brief 同时运行的测试点数
     */
    int capacity = 1;

    std::chrono::milliseconds poll_interval{200};

    /**
     * @brief 心跳间隔，注册后以 master 返回的值为准
     */
    std::chrono::milliseconds heartbeat_interval{2000};

    /**
     * @brief 注册失败后的重试间隔
     */
    std::chrono::milliseconds register_retry_interval{1000};
};

/**
 * @brief worker 的主体
 * 向 master 注册，定时心跳，拉取分配给自己的提交。每个提交在独立的线程中评测：
 * 编译一次，之后每个测试点占用一个执行位置并发运行，结果产生后立即上报。
 */
struct agent {
    agent(master_client &client, sandbox::sandbox &box,
          std::shared_ptr<const language::registry> languages, agent_config config);
    ~agent();

    const std::string &id() const;

    /**
     * @brief 注册并启动心跳线程和拉取线程
     * 注册失败时一直重试，直到注册成功或者 stop 被调用。agent 只能启动一次。
     */
    void start();

    /**
     * @brief 停止拉取新的提交，等待正在评测的提交结束
     */
    void stop();

    /**
     * @brief 向 master 注册，失败时重试直到成功或者 agent 被停止
     * @return 是否注册成功
     */
    bool register_self();

    /**
     * @brief 拉取一次提交，为每个提交启动评测线程，线程先向 master 确认再开始评测
     * @return 启动的提交数
     */
    std::size_t poll_once();

    /**
     * @brief 在当前线程中评测一个已经确认的提交并上报结果
     * 不会抛出异常。
     */
    void run_job(const message::assignment &task);

    /**
     * @brief 正在评测的提交数
     */
    std::size_t running_jobs() const;

    /**
     * @brief 等待所有正在评测的提交结束
     */
    void wait_jobs();

private:
    struct job_thread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    bool acknowledge(const message::assignment &task);

    void heartbeat_loop();
    void poll_loop();

    /**
     * @brief 回收已经结束的评测线程
     */
    void reap_jobs(bool all);

    /**
     * @brief 睡眠 duration，flag 被设置时提前醒来
     * @return flag 是否被设置
     */
    bool sleep_for(std::chrono::milliseconds duration, const bool &flag);

    master_client &client;
    sandbox::sandbox &box;
    std::shared_ptr<const language::registry> languages;
    agent_config cfg;
    slot_pool slots;

    std::atomic<int> heartbeat_interval_ms;

    /**
     * @brief master 不认识这个 worker，需要由拉取线程重新注册
     */
    std::atomic<bool> need_register{false};

    mutable std::mutex mut;
    std::condition_variable cv;
    /**
     * @brief 停止拉取新的提交
     */
    bool stopping = false;

    /**
     * @brief 所有提交评测结束，停止心跳
     */
    bool shutting_down = false;
    std::list<job_thread> jobs;

    std::thread heartbeat_thread;
    std::thread poll_thread;
};

}  // namespace dcx::worker
