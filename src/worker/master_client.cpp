#include "worker/master_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <mutex>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace dcx::worker {
using namespace std;
using namespace nlohmann;

master_client::~master_client() {}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = reinterpret_cast<string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * @brief 一次 HTTP 请求的结果，status 为 0 表示传输失败
 */
struct http_response {
    long status = 0;
    string body;
    string error;
};

static http_response perform_post(const string &url, const string &body) {
    // curl_global_init 不是线程安全的，只能调用一次
    static once_flag curl_init_flag;
    call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });

    http_response response;
    CURL *curl = curl_easy_init();
    if (!curl) {
        response.error = "unable to initialize curl";
        return response;
    }
    struct curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 3000L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 30000L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        response.error = curl_easy_strerror(code);
        return response;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

static string error_code_of(const http_response &response) {
    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded()) return "";
    return get_value_def<string>(j, "", "error");
}

curl_master_client::curl_master_client(const string &base_url, int report_retries, chrono::milliseconds backoff)
    : base_url(base_url), report_retries(report_retries), backoff(backoff) {
    while (!this->base_url.empty() && this->base_url.back() == '/')
        this->base_url.pop_back();
}

json curl_master_client::post(const string &path, const json &body) {
    string url = base_url + path;
    string payload = dump_lossy(body);
    string last_error;

    for (int retry = 0; retry <= report_retries; ++retry) {
        if (retry > 0) {
            LOG(WARNING) << "Retrying " << url << " (" << retry << "/" << report_retries << "): " << last_error;
            this_thread::sleep_for(backoff * retry);
        }

        http_response response = perform_post(url, payload);
        if (response.status == 0) {
            last_error = response.error;
            continue;
        }
        if (response.status >= 500) {
            last_error = fmt::format("master responded {}: {}", response.status, response.body);
            continue;
        }

        switch (response.status) {
            case 200: {
                if (response.body.empty()) return json::object();
                json result = json::parse(response.body, nullptr, false);
                if (result.is_discarded())
                    throw network_error("master responded malformed JSON for " + url);
                return result;
            }
            case 400:
                throw bad_request(error_code_of(response), fmt::format("{} rejected: {}", url, response.body));
            case 404:
                throw not_found(error_code_of(response), fmt::format("{} not found: {}", url, response.body));
            case 409:
                throw conflict(fmt::format("{} conflict: {}", url, response.body));
            default:
                throw network_error(fmt::format("master responded {} for {}: {}", response.status, url, response.body));
        }
    }
    throw network_error(fmt::format("unable to reach {} after {} retries: {}", url, report_retries, last_error));
}

int curl_master_client::register_worker(const message::worker_registration &registration) {
    json result = post("/internal/workers/register", registration);
    return get_value_def<int>(result, 2000, "heartbeat_interval_ms");
}

void curl_master_client::heartbeat(const string &worker_id) {
    post("/internal/workers/" + worker_id + "/heartbeat", json::object());
}

vector<message::assignment> curl_master_client::poll(const string &worker_id) {
    json result = post("/internal/workers/" + worker_id + "/poll", json::object());
    if (!exists(result, "assignments")) return {};
    try {
        return get_value<vector<message::assignment>>(result, "assignments");
    } catch (invalid_argument &e) {
        throw network_error(string("malformed assignments from master: ") + e.what());
    }
}

void curl_master_client::ack(const string &job_id, const message::job_report &report) {
    post("/internal/jobs/" + job_id + "/ack", report);
}

void curl_master_client::progress(const string &job_id, const message::job_progress &progress) {
    post("/internal/jobs/" + job_id + "/progress", progress);
}

void curl_master_client::verdicts(const string &job_id, const message::verdict_batch &batch) {
    post("/internal/jobs/" + job_id + "/verdicts", batch);
}

void curl_master_client::complete(const string &job_id, const message::job_report &report) {
    post("/internal/jobs/" + job_id + "/complete", report);
}

void curl_master_client::fail(const string &job_id, const message::job_report &report) {
    post("/internal/jobs/" + job_id + "/fail", report);
}

}  // namespace dcx::worker
