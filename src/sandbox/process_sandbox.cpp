#include "sandbox/process_sandbox.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <memory>
#include "common/utils.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/process.hpp"

namespace dcx::sandbox {
using namespace std;

int64_t address_space_ceiling(int memory_limit_mb) {
    int64_t limit = (int64_t)memory_limit_mb << 20;
    return max(limit * ADDRESS_SPACE_FACTOR, limit + ((int64_t)ADDRESS_SPACE_HEADROOM_MB << 20));
}

process_sandbox::process_sandbox(const string &cgroup_root, bool isolate_namespaces)
    : cgroup_root(cgroup_root), isolate_namespaces(isolate_namespaces) {
    if (!cgroup_root.empty()) cgroup_guard::init();
}

string process_sandbox::type() const {
    return "process";
}

void process_sandbox::execute(const request &req, const filesystem::path &dir, result &res) {
    int64_t memory_limit = (int64_t)req.memory_limit_mb << 20;

    process_options opt;
    opt.argv = {"/bin/sh", "-c", req.command};
    opt.workdir = dir;
    opt.input = req.input.value_or("");
    opt.timeout = chrono::milliseconds(req.time_limit_ms);
    opt.isolate_namespaces = isolate_namespaces;

    unique_ptr<cgroup_guard> cg;
    if (!cgroup_root.empty()) {
        cg = make_unique<cgroup_guard>(cgroup_root + "/run-" + generate_uuid(), memory_limit);
        opt.before_exec = [&cg](pid_t pid) { cg->attach(pid); };
    } else {
        opt.address_space_limit = address_space_ceiling(req.memory_limit_mb);
    }

    process_result pr = run_process(opt);

    res.exit_code = pr.exit_code;
    res.signal = pr.signal;
    res.timed_out = pr.timed_out;
    res.stdout_output = move(pr.stdout_output);
    res.stderr_output = move(pr.stderr_output);
    res.duration_ms = pr.duration_ms;

    int64_t peak = (int64_t)pr.max_rss_kb * 1024;
    if (cg) {
        cg->kill_all();
        res.oom_killed = cg->oom_killed();
        peak = max(peak, cg->peak_memory());
    } else {
        // 地址空间上限只防止失控的分配，是否超限根据结束后的内存峰值判定
        res.oom_killed = peak > memory_limit;
    }
    res.peak_memory_mb = (double)peak / (1 << 20);

    DLOG(INFO) << "Command " << req.command << " finished with exit code " << res.exit_code
               << " in " << res.duration_ms << "ms, peak memory " << res.peak_memory_mb << "MB";
}

}  // namespace dcx::sandbox
