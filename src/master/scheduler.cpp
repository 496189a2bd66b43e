#include "master/scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <vector>

namespace dcx::master {
using namespace std;

scheduler::scheduler(job_store &store, worker_registry &registry, scheduler_config config)
    : store(store), registry(registry), cfg(config) {}

scheduler::~scheduler() {
    stop();
}

void scheduler::start() {
    scoped_lock guard(mut);
    if (thread.joinable()) return;
    stopping = false;
    thread = std::thread(&scheduler::loop, this);
}

void scheduler::stop() {
    {
        scoped_lock guard(mut);
        stopping = true;
    }
    cv.notify_all();
    if (thread.joinable()) thread.join();
}

void scheduler::enqueue(const shared_ptr<job> &j) {
    {
        scoped_lock guard(mut);
        pending.emplace(j->sequence, j->id);
        woken = true;
    }
    cv.notify_one();
}

void scheduler::notify() {
    {
        scoped_lock guard(mut);
        woken = true;
    }
    cv.notify_one();
}

size_t scheduler::dispatch() {
    size_t dispatched = 0;
    vector<pair<shared_ptr<job>, int>> undelivered;
    {
        scoped_lock guard(mut);
        while (!pending.empty()) {
            shared_ptr<job> j = store.find(pending.begin()->second);
            if (!j) {
                // 已经被清理
                pending.erase(pending.begin());
                continue;
            }

            optional<string> worker_id = registry.acquire_slot(j->id);
            if (!worker_id) break;
            pending.erase(pending.begin());

            message::assignment task;
            bool assignable;
            {
                scoped_lock job_guard(j->mut);
                assignable = j->status == job_status::PENDING;
                if (assignable) {
                    ++j->attempts;
                    j->worker_id = *worker_id;
                    j->acknowledged = false;
                    j->assigned_at = chrono::steady_clock::now();
                    j->set_status(job_status::ASSIGNED);

                    task.job_id = j->id;
                    task.attempt = j->attempts;
                    task.language = j->language;
                    task.source_code = j->source_code;
                    task.test_cases = j->missing_test_cases();
                    task.time_limit_ms = j->time_limit_ms;
                    task.memory_limit_mb = j->memory_limit_mb;
                }
            }

            if (!assignable) {
                registry.release_slot(*worker_id, j->id);
                continue;
            }

            LOG(INFO) << "[" << j->id << "] assigned to worker " << *worker_id << " (attempt " << task.attempt << ")";
            if (registry.deliver(*worker_id, task))
                ++dispatched;
            else
                undelivered.emplace_back(j, task.attempt);
        }
    }

    // worker 在分配过程中被驱逐
    for (auto &[j, attempt] : undelivered)
        retry(j, attempt, "worker left before receiving the job");
    return dispatched;
}

void scheduler::check_timeouts() {
    auto now = chrono::steady_clock::now();
    vector<pair<shared_ptr<job>, int>> unacknowledged;
    for (auto &j : store.all()) {
        scoped_lock guard(j->mut);
        if (j->status == job_status::ASSIGNED && !j->acknowledged && now - j->assigned_at > cfg.ack_timeout)
            unacknowledged.emplace_back(j, j->attempts);
    }
    for (auto &[j, attempt] : unacknowledged)
        retry(j, attempt, fmt::format("worker did not acknowledge within {}ms", cfg.ack_timeout.count()));

    for (auto &w : registry.evict_expired(cfg.heartbeat_timeout))
        reassign(w.id, w.jobs, fmt::format("worker {} missed heartbeats", w.id));

    size_t purged = store.purge(cfg.job_retention);
    if (purged > 0) LOG(INFO) << "Purged " << purged << " expired jobs";
}

void scheduler::retry(const shared_ptr<job> &j, int attempt, const string &reason) {
    string worker_id;
    bool requeue = false;
    {
        scoped_lock guard(j->mut);
        if (j->attempts != attempt || j->status == job_status::PENDING || is_terminal(j->status))
            return;

        worker_id = j->worker_id;
        j->worker_id.clear();
        j->acknowledged = false;

        if (j->all_verdicts_recorded()) {
            LOG(INFO) << "[" << j->id << "] attempt " << attempt << " failed (" << reason << ") but every test case has a verdict";
            j->set_status(job_status::COMPLETED);
        } else if (j->attempts >= cfg.max_attempts) {
            LOG(WARNING) << "[" << j->id << "] failed after " << j->attempts << " attempts: " << reason;
            j->error = fmt::format("gave up after {} attempts: {}", j->attempts, reason);
            j->set_status(job_status::FAILED);
        } else {
            LOG(WARNING) << "[" << j->id << "] attempt " << attempt << " failed: " << reason << ", requeued";
            j->set_status(job_status::PENDING);
            requeue = true;
        }
    }

    if (!worker_id.empty()) registry.release_slot(worker_id, j->id);

    {
        scoped_lock guard(mut);
        if (requeue) pending.emplace(j->sequence, j->id);
        woken = true;
    }
    cv.notify_one();
}

void scheduler::reassign(const string &worker_id, const set<string> &job_ids, const string &reason) {
    for (auto &job_id : job_ids) {
        shared_ptr<job> j = store.find(job_id);
        if (!j) continue;
        int attempt;
        {
            scoped_lock guard(j->mut);
            if (j->worker_id != worker_id) continue;
            attempt = j->attempts;
        }
        retry(j, attempt, reason);
    }
}

const scheduler_config &scheduler::config() const {
    return cfg;
}

size_t scheduler::pending_size() const {
    scoped_lock guard(mut);
    return pending.size();
}

void scheduler::loop() {
    auto last_check = chrono::steady_clock::now();
    while (true) {
        {
            unique_lock<mutex> lock(mut);
            cv.wait_for(lock, cfg.tick, [this] { return woken || stopping; });
            if (stopping) break;
            woken = false;
        }

        try {
            auto now = chrono::steady_clock::now();
            if (now - last_check >= cfg.tick) {
                check_timeouts();
                last_check = now;
            }
            dispatch();
        } catch (exception &e) {
            LOG(ERROR) << "Scheduler iteration failed: " << boost::diagnostic_information(e);
        }
    }
}

}  // namespace dcx::master
