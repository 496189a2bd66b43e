#include "master/http_api.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <functional>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace dcx::master {
using namespace std;
using namespace nlohmann;

const char *const JSON_CONTENT_TYPE = "application/json";

static void reply(httplib::Response &res, int status, const json &body) {
    res.status = status;
    res.set_content(dump_lossy(body), JSON_CONTENT_TYPE);
}

static json parse_request(const httplib::Request &req) {
    if (req.body.empty()) return json::object();
    try {
        return json::parse(req.body);
    } catch (json::parse_error &e) {
        throw bad_request("invalid_json", e.what());
    }
}

using handler = function<void(const httplib::Request &, httplib::Response &)>;

/**
 * @brief 将 service 抛出的异常转换为对应的 HTTP 状态码
 */
static handler guarded(handler f) {
    return [f](const httplib::Request &req, httplib::Response &res) {
        try {
            f(req, res);
        } catch (bad_request &e) {
            reply(res, 400, {{"error", e.code}, {"message", e.what()}});
        } catch (not_found &e) {
            reply(res, 404, {{"error", e.code}, {"message", e.what()}});
        } catch (conflict &e) {
            reply(res, 409, {{"error", "stale_attempt"}, {"message", e.what()}});
        } catch (exception &e) {
            LOG(ERROR) << req.method << " " << req.path << " failed: " << boost::diagnostic_information(e);
            reply(res, 500, {{"error", "internal_error"}, {"message", e.what()}});
        }
    };
}

http_api::http_api(service &svc) : svc(svc) {}

void http_api::bind(httplib::Server &server) {
    server.Get("/health", [](const httplib::Request &, httplib::Response &res) {
        reply(res, 200, {{"status", "ok"}});
    });

    server.Post("/submit", guarded([this](const httplib::Request &req, httplib::Response &res) {
        string job_id = svc.submit(parse_request(req));
        reply(res, 200, {{"job_id", job_id}});
    }));

    server.Get(R"(/status/([^/]+))", guarded([this](const httplib::Request &req, httplib::Response &res) {
        reply(res, 200, svc.status(req.matches[1]));
    }));

    server.Get("/workers", guarded([this](const httplib::Request &, httplib::Response &res) {
        reply(res, 200, svc.workers());
    }));

    server.Post("/internal/workers/register", guarded([this](const httplib::Request &req, httplib::Response &res) {
        reply(res, 200, svc.register_worker(parse_request(req)));
    }));

    server.Post(R"(/internal/workers/([^/]+)/heartbeat)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        svc.heartbeat(req.matches[1]);
        reply(res, 200, json::object());
    }));

    server.Post(R"(/internal/workers/([^/]+)/poll)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        reply(res, 200, svc.poll(req.matches[1]));
    }));

    server.Post(R"(/internal/jobs/([^/]+)/ack)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        svc.ack(req.matches[1], parse_request(req));
        reply(res, 200, json::object());
    }));

    server.Post(R"(/internal/jobs/([^/]+)/progress)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        svc.progress(req.matches[1], parse_request(req));
        reply(res, 200, json::object());
    }));

    server.Post(R"(/internal/jobs/([^/]+)/verdicts)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        reply(res, 200, svc.record_verdicts(req.matches[1], parse_request(req)));
    }));

    server.Post(R"(/internal/jobs/([^/]+)/complete)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        svc.complete(req.matches[1], parse_request(req));
        reply(res, 200, json::object());
    }));

    server.Post(R"(/internal/jobs/([^/]+)/fail)", guarded([this](const httplib::Request &req, httplib::Response &res) {
        svc.fail(req.matches[1], parse_request(req));
        reply(res, 200, json::object());
    }));
}

}  // namespace dcx::master
