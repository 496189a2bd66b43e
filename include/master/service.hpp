#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "language/profile.hpp"
#include "master/job_store.hpp"
#include "master/scheduler.hpp"
#include "master/worker_registry.hpp"

namespace dcx::master {

struct service_config {
    /**
     * @brief 一个提交最多包含多少个测试点
     */
    std::size_t max_test_cases = 256;

    /**
     * @brief 注册时告知 worker 的心跳间隔
     */
    int heartbeat_interval_ms = 2000;
};

/**
 * @brief master 对外提供的全部操作，HTTP 层只负责路由和状态码
 *
 * 请求不合法时抛出 bad_request，对象不存在时抛出 not_found，
 * worker 的上报已经过期时抛出 conflict。
 */
struct service {
    service(std::shared_ptr<const language::registry> languages, job_store &store,
            worker_registry &registry, scheduler &sched, service_config config = {});

    /**
     * @brief 校验并创建提交，放入等待队列
     * @param body 请求体
     * @return 提交编号
     * @throw bad_request 请求不合法，此时不会创建任何状态
     */
    std::string submit(const nlohmann::json &body);

    /**
     * @brief 查询提交的状态，评测结果按照测试点在提交中的顺序排列
     * @throw not_found
     */
    nlohmann::json status(const std::string &job_id) const;

    nlohmann::json workers() const;

    /**
     * @return {heartbeat_interval_ms}
     */
    nlohmann::json register_worker(const nlohmann::json &body);

    /**
     * @throw not_found worker 不存在，需要重新注册
     */
    void heartbeat(const std::string &worker_id);

    /**
     * @return {assignments: [...]}
     * @throw not_found worker 不存在，需要重新注册
     */
    nlohmann::json poll(const std::string &worker_id);

    void ack(const std::string &job_id, const nlohmann::json &body);
    void progress(const std::string &job_id, const nlohmann::json &body);

    /**
     * @return {recorded, duplicates}
     */
    nlohmann::json record_verdicts(const std::string &job_id, const nlohmann::json &body);

    void complete(const std::string &job_id, const nlohmann::json &body);
    void fail(const std::string &job_id, const nlohmann::json &body);

private:
    std::shared_ptr<job> find_job(const std::string &job_id) const;

    std::shared_ptr<const language::registry> languages;
    job_store &store;
    worker_registry &registry;
    scheduler &sched;
    service_config cfg;
};

}  // namespace dcx::master
