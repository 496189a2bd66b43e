#include "master/job_store.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace dcx::master {
using namespace std;

bool job::record_verdict(const message::verdict &v) {
    bool known = any_of(test_cases.begin(), test_cases.end(),
                        [&](const message::test_case &tc) { return tc.id == v.test_case_id; });
    if (!known)
        throw bad_request("unknown_test_case", "test case " + v.test_case_id + " does not belong to job " + id);
    bool inserted = verdicts.emplace(v.test_case_id, v).second;
    if (inserted) updated_at = now_millis();
    return inserted;
}

bool job::all_verdicts_recorded() const {
    return all_of(test_cases.begin(), test_cases.end(),
                  [&](const message::test_case &tc) { return verdicts.count(tc.id) > 0; });
}

vector<message::test_case> job::missing_test_cases() const {
    vector<message::test_case> result;
    for (auto &tc : test_cases)
        if (!verdicts.count(tc.id))
            result.push_back(tc);
    return result;
}

void job::set_status(job_status next) {
    status = next;
    updated_at = now_millis();
    if (is_terminal(next)) finished_at = chrono::steady_clock::now();
}

shared_ptr<job> job_store::create(const string &language, const string &source_code,
                                  vector<message::test_case> test_cases,
                                  int time_limit_ms, int memory_limit_mb) {
    auto j = make_shared<job>();
    j->id = generate_uuid();
    j->language = language;
    j->source_code = source_code;
    j->test_cases = move(test_cases);
    j->time_limit_ms = time_limit_ms;
    j->memory_limit_mb = memory_limit_mb;
    j->created_at = j->updated_at = now_millis();

    scoped_lock guard(mut);
    j->sequence = next_sequence++;
    jobs[j->id] = j;
    return j;
}

shared_ptr<job> job_store::find(const string &id) const {
    scoped_lock guard(mut);
    auto it = jobs.find(id);
    if (it == jobs.end()) return nullptr;
    return it->second;
}

vector<shared_ptr<job>> job_store::all() const {
    scoped_lock guard(mut);
    vector<shared_ptr<job>> result;
    result.reserve(jobs.size());
    for (auto &[id, j] : jobs)
        result.push_back(j);
    return result;
}

size_t job_store::purge(chrono::seconds retention) {
    auto now = chrono::steady_clock::now();
    size_t purged = 0;
    scoped_lock guard(mut);
    for (auto it = jobs.begin(); it != jobs.end();) {
        bool expired;
        {
            scoped_lock job_guard(it->second->mut);
            expired = is_terminal(it->second->status) && now - it->second->finished_at > retention;
        }
        if (expired) {
            DLOG(INFO) << "[" << it->first << "] purged";
            it = jobs.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

size_t job_store::size() const {
    scoped_lock guard(mut);
    return jobs.size();
}

}  // namespace dcx::master
