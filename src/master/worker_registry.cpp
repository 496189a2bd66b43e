#include "master/worker_registry.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace dcx::master {
using namespace std;

set<string> worker_registry::register_worker(const message::worker_registration &reg) {
    scoped_lock guard(mut);
    set<string> orphaned;
    auto it = workers.find(reg.id);
    if (it != workers.end()) {
        orphaned = move(it->second.jobs);
        LOG(INFO) << "Worker " << reg.id << " registered again, " << orphaned.size() << " jobs orphaned";
    } else {
        LOG(INFO) << "Worker " << reg.id << " registered at " << reg.address << " with capacity " << reg.capacity;
    }

    worker &w = workers[reg.id];
    w = worker();
    w.id = reg.id;
    w.address = reg.address;
    w.capacity = reg.capacity;
    w.available_slots = reg.capacity;
    w.last_heartbeat = chrono::steady_clock::now();
    return orphaned;
}

bool worker_registry::heartbeat(const string &worker_id) {
    scoped_lock guard(mut);
    auto it = workers.find(worker_id);
    if (it == workers.end()) return false;
    it->second.last_heartbeat = chrono::steady_clock::now();
    return true;
}

bool worker_registry::contains(const string &worker_id) const {
    scoped_lock guard(mut);
    return workers.count(worker_id) > 0;
}

optional<string> worker_registry::acquire_slot(const string &job_id) {
    scoped_lock guard(mut);
    worker *best = nullptr;
    // map 按编号有序，严格大于保证了相同空闲位置时选中编号最小的
    for (auto &[id, w] : workers)
        if (w.available_slots > 0 && (!best || w.available_slots > best->available_slots))
            best = &w;
    if (!best) return nullopt;

    --best->available_slots;
    best->jobs.insert(job_id);
    return best->id;
}

bool worker_registry::deliver(const string &worker_id, const message::assignment &task) {
    scoped_lock guard(mut);
    auto it = workers.find(worker_id);
    if (it == workers.end() || !it->second.jobs.count(task.job_id)) return false;
    it->second.outbox.push_back(task);
    return true;
}

optional<vector<message::assignment>> worker_registry::take_assignments(const string &worker_id) {
    scoped_lock guard(mut);
    auto it = workers.find(worker_id);
    if (it == workers.end()) return nullopt;
    it->second.last_heartbeat = chrono::steady_clock::now();
    vector<message::assignment> result;
    result.swap(it->second.outbox);
    return result;
}

void worker_registry::release_slot(const string &worker_id, const string &job_id) {
    scoped_lock guard(mut);
    auto it = workers.find(worker_id);
    if (it == workers.end()) return;
    worker &w = it->second;
    if (!w.jobs.erase(job_id)) return;
    w.available_slots = min(w.available_slots + 1, w.capacity);
    w.outbox.erase(remove_if(w.outbox.begin(), w.outbox.end(),
                             [&](const message::assignment &task) { return task.job_id == job_id; }),
                   w.outbox.end());
}

vector<evicted_worker> worker_registry::evict_expired(chrono::milliseconds timeout) {
    auto now = chrono::steady_clock::now();
    vector<evicted_worker> evicted;
    scoped_lock guard(mut);
    for (auto it = workers.begin(); it != workers.end();) {
        if (now - it->second.last_heartbeat > timeout) {
            LOG(WARNING) << "Worker " << it->first << " missed heartbeats, evicting with "
                         << it->second.jobs.size() << " jobs in flight";
            evicted.push_back({it->first, move(it->second.jobs)});
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

vector<message::worker_info> worker_registry::snapshot() const {
    auto now = chrono::steady_clock::now();
    scoped_lock guard(mut);
    vector<message::worker_info> result;
    for (auto &[id, w] : workers) {
        message::worker_info info;
        info.id = w.id;
        info.address = w.address;
        info.capacity = w.capacity;
        info.available_slots = w.available_slots;
        info.running_jobs = (int)w.jobs.size();
        info.last_heartbeat_ms = chrono::duration_cast<chrono::milliseconds>(now - w.last_heartbeat).count();
        result.push_back(info);
    }
    return result;
}

}  // namespace dcx::master
