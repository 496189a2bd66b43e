#include "sandbox/cgroup.hpp"
#include <libcgroup.h>
#include <signal.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <fstream>
#include <mutex>
#include <thread>

namespace dcx::sandbox {
using namespace std;

// 删除 cgroup 前等待其中的进程全部退出的最长时间
const int CGROUP_DRAIN_RETRIES = 100;

cgroup_exception::cgroup_exception(const string &cgroup_op, int err)
    : internal_error(err == ECGOTHER
                         ? fmt::format("libcgroup: {}: {}", cgroup_op, cgroup_strerror(cgroup_get_last_errno()))
                         : fmt::format("{}: {}", cgroup_op, cgroup_strerror(err))) {}

void cgroup_exception::ensure(const string &cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    static once_flag flag;
    call_once(flag, [] {
        cgroup_exception::ensure("cgroup_init", cgroup_init());
    });
}

static filesystem::path memory_mount_point() {
    char *mount_point = nullptr;
    if (cgroup_get_subsys_mount_point("memory", &mount_point) != 0 || !mount_point)
        return "/sys/fs/cgroup";
    filesystem::path result(mount_point);
    free(mount_point);
    return result;
}

cgroup_guard::cgroup_guard(const string &cgroup_name, int64_t memory_limit)
    : name(cgroup_name) {
    dir = memory_mount_point() / filesystem::path(cgroup_name).relative_path();

    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(fmt::format("cgroup_new_cgroup({})", cgroup_name), cgroup_get_last_errno());

    struct cgroup_controller *ctrl = cgroup_add_controller(cg, "memory");
    if (!ctrl) {
        cgroup_free(&cg);
        throw cgroup_exception("cgroup_add_controller(memory)", cgroup_get_last_errno());
    }

    try {
        // 将交换空间限制为 0，内存超限时直接触发 OOM killer
        cgroup_exception::ensure(fmt::format("cgroup_add_value_int64(memory.max, {})", memory_limit),
                                 cgroup_add_value_int64(ctrl, "memory.max", memory_limit));
        // 没有开启交换空间统计的内核不提供 memory.swap.max
        if (filesystem::exists(dir.parent_path() / "memory.swap.max"))
            cgroup_exception::ensure("cgroup_add_value_int64(memory.swap.max, 0)",
                                     cgroup_add_value_int64(ctrl, "memory.swap.max", 0));
        cgroup_exception::ensure(fmt::format("cgroup_create_cgroup({})", cgroup_name),
                                 cgroup_create_cgroup(cg, 1));
    } catch (cgroup_exception &) {
        cgroup_free(&cg);
        throw;
    }
}

cgroup_guard::~cgroup_guard() {
    kill_all();

    // 被杀死的进程退出之后 cgroup 才能被删除
    int ret = 0;
    for (int i = 0; i < CGROUP_DRAIN_RETRIES; ++i) {
        ret = cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION);
        if (ret == 0) break;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    if (ret != 0)
        LOG(ERROR) << "Unable to delete cgroup " << name << ": " << cgroup_strerror(ret);
    cgroup_free(&cg);
}

void cgroup_guard::attach(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

bool cgroup_guard::oom_killed() const {
    ifstream fin(dir / "memory.events");
    while (fin.good()) {
        string token;
        int64_t value = 0;
        fin >> token >> value;
        if (token == "oom_kill")
            return value > 0;
    }
    return false;
}

int64_t cgroup_guard::peak_memory() const {
    ifstream fin(dir / "memory.peak");
    int64_t value = 0;
    if (fin >> value) return value;
    return 0;
}

const filesystem::path &cgroup_guard::path() const {
    return dir;
}

void cgroup_guard::kill_all() {
    // Linux 5.14 起支持 cgroup.kill
    if (filesystem::exists(dir / "cgroup.kill")) {
        ofstream fout(dir / "cgroup.kill");
        fout << 1;
        if (fout) return;
    }

    void *handle = nullptr;
    pid_t pid;
    int ret = cgroup_get_task_begin(name.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        kill(pid, SIGKILL);
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
}

}  // namespace dcx::sandbox
