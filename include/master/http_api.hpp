#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include "master/service.hpp"

namespace dcx::master {

/**
 * @brief 将 service 的操作绑定到 HTTP 路由
 *
 * 公开接口：
 *   POST /submit, GET /status/{id}, GET /workers, GET /health
 * worker 使用的内部接口：
 *   POST /internal/workers/register
 *   POST /internal/workers/{id}/heartbeat
 *   POST /internal/workers/{id}/poll
 *   POST /internal/jobs/{id}/ack|progress|verdicts|complete|fail
 *
 * 异常到状态码的映射：bad_request → 400，not_found → 404，conflict → 409，其他 → 500。
 * 错误响应体为 {"error": "<code>", "message": "..."}。
 */
struct http_api {
    explicit http_api(service &svc);

    void bind(httplib::Server &server);

private:
    service &svc;
};

}  // namespace dcx::master
