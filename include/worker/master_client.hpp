#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/messages.hpp"

namespace dcx::worker {

/**
 * @brief worker 与 master 之间的内部协议
 *
 * 所有操作失败时抛出异常：
 * not_found: worker 或提交不存在，worker 收到时需要重新注册
 * conflict: 上报已经过期，提交被重新分配给了其他 worker
 * bad_request: 上报的内容不合法
 * network_error: 多次重试之后仍然无法连接 master
 */
struct master_client {
    virtual ~master_client();

    /**
     * @brief 注册 worker，同一个编号重复注册会替换之前的记录
     * @return master 要求的心跳间隔（毫秒）
     */
    virtual int register_worker(const message::worker_registration &registration) = 0;

    virtual void heartbeat(const std::string &worker_id) = 0;

    /**
     * @brief 拉取分配给这个 worker 的提交
     */
    virtual std::vector<message::assignment> poll(const std::string &worker_id) = 0;

    virtual void ack(const std::string &job_id, const message::job_report &report) = 0;
    virtual void progress(const std::string &job_id, const message::job_progress &progress) = 0;
    virtual void verdicts(const std::string &job_id, const message::verdict_batch &batch) = 0;
    virtual void complete(const std::string &job_id, const message::job_report &report) = 0;
    virtual void fail(const std::string &job_id, const message::job_report &report) = 0;
};

/**
 * @brief 通过 libcurl 访问 master 的 HTTP 接口
 * 传输失败或者 master 返回 5xx 时自动重试，重试间隔线性增长。
 * 可以被多个线程同时使用。
 */
struct curl_master_client : public master_client {
    /**
     * @param base_url master 的地址，比如 http://127.0.0.1:8080
     * @param report_retries 传输失败时的最大重试次数
     * @param backoff 第 i 次重试前等待 i * backoff
     */
    explicit curl_master_client(const std::string &base_url, int report_retries = 3,
                                std::chrono::milliseconds backoff = std::chrono::milliseconds(200));

    int register_worker(const message::worker_registration &registration) override;
    void heartbeat(const std::string &worker_id) override;
    std::vector<message::assignment> poll(const std::string &worker_id) override;
    void ack(const std::string &job_id, const message::job_report &report) override;
    void progress(const std::string &job_id, const message::job_progress &progress) override;
    void verdicts(const std::string &job_id, const message::verdict_batch &batch) override;
    void complete(const std::string &job_id, const message::job_report &report) override;
    void fail(const std::string &job_id, const message::job_report &report) override;

private:
    /**
     * @brief 发送 POST 请求并解析返回的 JSON
     * @throw network_error 重试次数用完
     */
    nlohmann::json post(const std::string &path, const nlohmann::json &body);

    std::string base_url;
    int report_retries;
    std::chrono::milliseconds backoff;
};

}  // namespace dcx::worker
