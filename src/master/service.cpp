#include "master/service.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace dcx::master {
using namespace std;
using namespace nlohmann;

template <typename T>
static T parse_body(const json &body) {
    try {
        return body.get<T>();
    } catch (json::exception &e) {
        throw bad_request("invalid_request", e.what());
    } catch (invalid_argument &e) {
        throw bad_request("invalid_request", e.what());
    }
}

/**
 * @brief 读取可选的资源限制，超出范围的值被截断
 * @throw bad_request 限制不是整数
 */
static int parse_limit(const json &body, const char *key, int def_value, int min_value, int max_value) {
    const json *value = find_member(body, key);
    if (!value || value->is_null()) return def_value;
    if (!value->is_number_integer())
        throw bad_request("invalid_limit", fmt::format("{} must be an integer", key));
    if (value->is_number_unsigned() && value->get<uint64_t>() > (uint64_t)max_value)
        return max_value;
    return (int)clamp<int64_t>(value->get<int64_t>(), min_value, max_value);
}

static void ensure_string(const json &entry, const char *key) {
    const json *value = find_member(entry, key);
    if (!value || !value->is_string())
        throw bad_request("invalid_test_cases", fmt::format("test case {} must be a string", key));
}

/**
 * @brief 确认上报属于提交当前的分配，调用方需要持有提交的锁
 * @throw conflict 提交已经被重新分配、已经结束，或者 worker 不是当前的 worker
 */
static void ensure_current(const job &j, const string &worker_id, int attempt) {
    if (is_terminal(j.status) || j.status == job_status::PENDING || j.worker_id != worker_id || j.attempts != attempt)
        throw conflict(fmt::format("stale report from worker {} for attempt {} of job {}", worker_id, attempt, j.id));
}

service::service(shared_ptr<const language::registry> languages, job_store &store,
                 worker_registry &registry, scheduler &sched, service_config config)
    : languages(move(languages)), store(store), registry(registry), sched(sched), cfg(config) {}

string service::submit(const json &body) {
    if (!body.is_object())
        throw bad_request("invalid_json", "request body must be a JSON object");

    const json *language = find_member(body, "language");
    if (!language || !language->is_string() || !languages->contains(language->get<string>()))
        throw bad_request("unknown_language", "language is not supported");

    const json *source_code = find_member(body, "source_code");
    if (!source_code || !source_code->is_string() || source_code->get<string>().empty())
        throw bad_request("invalid_source_code", "source_code must be a non-empty string");

    const json *cases = find_member(body, "test_cases");
    if (!cases || !cases->is_array() || cases->empty())
        throw bad_request("invalid_test_cases", "test_cases must be a non-empty array");
    if (cases->size() > cfg.max_test_cases)
        throw bad_request("too_many_test_cases", fmt::format("at most {} test cases are allowed", cfg.max_test_cases));

    vector<message::test_case> test_cases;
    set<string> ids;
    for (const json &entry : *cases) {
        if (!entry.is_object())
            throw bad_request("invalid_test_cases", "test case must be an object");
        ensure_string(entry, "id");
        ensure_string(entry, "input");
        ensure_string(entry, "expected_output");

        message::test_case tc = entry.get<message::test_case>();
        if (tc.id.empty())
            throw bad_request("invalid_test_cases", "test case id must not be empty");
        if (!ids.insert(tc.id).second)
            throw bad_request("duplicate_test_case_id", "duplicate test case id " + tc.id);
        test_cases.push_back(move(tc));
    }

    int time_limit_ms = parse_limit(body, "time_limit_ms", DEFAULT_TIME_LIMIT_MS, MIN_TIME_LIMIT_MS, MAX_TIME_LIMIT_MS);
    int memory_limit_mb = parse_limit(body, "memory_limit_mb", DEFAULT_MEMORY_LIMIT_MB, MIN_MEMORY_LIMIT_MB, MAX_MEMORY_LIMIT_MB);

    shared_ptr<job> j = store.create(language->get<string>(), source_code->get<string>(), move(test_cases),
                                     time_limit_ms, memory_limit_mb);
    LOG(INFO) << "[" << j->id << "] submitted: " << j->language << ", " << j->test_cases.size()
              << " test cases, " << time_limit_ms << "ms, " << memory_limit_mb << "MB";
    sched.enqueue(j);
    return j->id;
}

shared_ptr<job> service::find_job(const string &job_id) const {
    shared_ptr<job> j = store.find(job_id);
    if (!j) throw not_found("job_not_found", "job " + job_id + " does not exist");
    return j;
}

json service::status(const string &job_id) const {
    shared_ptr<job> j = find_job(job_id);
    scoped_lock guard(j->mut);

    json verdicts = json::array();
    for (auto &tc : j->test_cases) {
        auto it = j->verdicts.find(tc.id);
        if (it != j->verdicts.end()) verdicts.push_back(it->second);
    }

    json result = {{"job_id", j->id},
                   {"status", j->status},
                   {"language", j->language},
                   {"verdicts", verdicts},
                   {"attempts", j->attempts},
                   {"created_at", j->created_at},
                   {"updated_at", j->updated_at}};
    if (j->compiler_output) result["compiler_output"] = *j->compiler_output;
    if (!j->error.empty()) result["error"] = j->error;
    return result;
}

json service::workers() const {
    json result = json::array();
    for (auto &info : registry.snapshot())
        result.push_back(info);
    return result;
}

json service::register_worker(const json &body) {
    auto reg = parse_body<message::worker_registration>(body);
    if (reg.id.empty() || reg.capacity <= 0)
        throw bad_request("invalid_request", "worker id must not be empty and capacity must be positive");

    set<string> orphaned = registry.register_worker(reg);
    if (!orphaned.empty())
        sched.reassign(reg.id, orphaned, fmt::format("worker {} restarted", reg.id));
    sched.notify();
    return {{"heartbeat_interval_ms", cfg.heartbeat_interval_ms}};
}

void service::heartbeat(const string &worker_id) {
    if (!registry.heartbeat(worker_id))
        throw not_found("worker_not_found", "worker " + worker_id + " is not registered");
}

json service::poll(const string &worker_id) {
    auto assignments = registry.take_assignments(worker_id);
    if (!assignments)
        throw not_found("worker_not_found", "worker " + worker_id + " is not registered");
    return {{"assignments", *assignments}};
}

void service::ack(const string &job_id, const json &body) {
    auto report = parse_body<message::job_report>(body);
    shared_ptr<job> j = find_job(job_id);
    scoped_lock guard(j->mut);
    ensure_current(*j, report.worker_id, report.attempt);
    if (!j->acknowledged)
        DLOG(INFO) << "[" << j->id << "] acknowledged by " << report.worker_id;
    j->acknowledged = true;
}

void service::progress(const string &job_id, const json &body) {
    auto report = parse_body<message::job_progress>(body);
    if (report.status != job_status::COMPILING && report.status != job_status::RUNNING)
        throw bad_request("invalid_status", "progress status must be compiling or running");

    shared_ptr<job> j = find_job(job_id);
    scoped_lock guard(j->mut);
    ensure_current(*j, report.worker_id, report.attempt);
    j->acknowledged = true;

    // 状态只能前进
    if (report.status == job_status::COMPILING && j->status == job_status::ASSIGNED)
        j->set_status(job_status::COMPILING);
    else if (report.status == job_status::RUNNING && (j->status == job_status::ASSIGNED || j->status == job_status::COMPILING))
        j->set_status(job_status::RUNNING);
}

json service::record_verdicts(const string &job_id, const json &body) {
    auto batch = parse_body<message::verdict_batch>(body);
    for (auto &v : batch.verdicts)
        if (v.result == outcome::INTERNAL_ERROR)
            throw bad_request("invalid_verdict", "internal_error must be reported through fail");

    shared_ptr<job> j = find_job(job_id);
    scoped_lock guard(j->mut);
    ensure_current(*j, batch.worker_id, batch.attempt);
    for (auto &v : batch.verdicts) {
        bool known = any_of(j->test_cases.begin(), j->test_cases.end(),
                            [&](const message::test_case &tc) { return tc.id == v.test_case_id; });
        if (!known)
            throw bad_request("unknown_test_case", "test case " + v.test_case_id + " does not belong to job " + j->id);
    }

    j->acknowledged = true;
    if (batch.compiler_output && !j->compiler_output)
        j->compiler_output = batch.compiler_output;

    int recorded = 0, duplicates = 0;
    for (auto &v : batch.verdicts) {
        if (j->record_verdict(v)) {
            ++recorded;
        } else {
            ++duplicates;
            LOG(WARNING) << "[" << j->id << "] duplicate verdict for test case " << v.test_case_id << " ignored";
        }
    }
    return {{"recorded", recorded}, {"duplicates", duplicates}};
}

void service::complete(const string &job_id, const json &body) {
    auto report = parse_body<message::job_report>(body);
    shared_ptr<job> j = find_job(job_id);
    size_t missing;
    {
        scoped_lock guard(j->mut);
        ensure_current(*j, report.worker_id, report.attempt);
        missing = j->missing_test_cases().size();
        if (missing == 0) {
            j->worker_id.clear();
            j->set_status(job_status::COMPLETED);
        }
    }

    if (missing == 0) {
        LOG(INFO) << "[" << job_id << "] completed";
        registry.release_slot(report.worker_id, job_id);
        sched.notify();
    } else {
        sched.retry(j, report.attempt, fmt::format("worker completed with {} test cases missing", missing));
    }
}

void service::fail(const string &job_id, const json &body) {
    auto report = parse_body<message::job_report>(body);
    shared_ptr<job> j = find_job(job_id);
    {
        scoped_lock guard(j->mut);
        ensure_current(*j, report.worker_id, report.attempt);
    }
    sched.retry(j, report.attempt, report.reason.empty() ? "worker reported failure" : report.reason);
}

}  // namespace dcx::master
