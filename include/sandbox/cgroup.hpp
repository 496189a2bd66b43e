#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include "common/exceptions.hpp"

struct cgroup;

namespace dcx::sandbox {

struct cgroup_exception : public internal_error {
    cgroup_exception(const std::string &cgroup_op, int err);

    static void ensure(const std::string &cgroup_op, int err);
};

/**
 * @brief 一次运行独占的 cgroup (v2)，限制内存并统计内存峰值
 * 构造时在内核中创建 cgroup，析构时杀死其中所有进程并删除 cgroup，
 * 因此无论沙箱从哪条路径退出，cgroup 都不会泄漏。
 *
 * cgroup 创建在 CGROUP_ROOT 下，该 cgroup 必须已经被委派给当前用户，
 * 并在 cgroup.subtree_control 中启用了 memory 控制器。
 */
struct cgroup_guard {
    /**
     * @brief 初始化 libcgroup，进程内只会执行一次
     * @throw cgroup_exception 系统没有挂载 cgroup
     */
    static void init();

    /**
     * @param cgroup_name cgroup 相对于挂载点的名称，如 /dcx/run-xxxx
     * @param memory_limit 内存上限（字节），同时禁止使用交换空间
     * @throw cgroup_exception 创建失败
     */
    cgroup_guard(const std::string &cgroup_name, int64_t memory_limit);
    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 将进程 pid 移入本 cgroup
     */
    void attach(pid_t pid);

    /**
     * @brief cgroup 内是否有进程因为内存超限被 OOM killer 杀死
     * 读取 memory.events 中的 oom_kill 计数
     */
    bool oom_killed() const;

    /**
     * @brief cgroup 的内存使用峰值（字节）
     * 内核不支持 memory.peak 时返回 0
     */
    int64_t peak_memory() const;

    /**
     * @brief 杀死 cgroup 内所有的进程，包括脱离了进程组的后代进程
     */
    void kill_all();

    /**
     * @brief cgroup 在 cgroup 文件系统中的目录
     */
    const std::filesystem::path &path() const;

private:
    struct cgroup *cg;
    std::string name;
    std::filesystem::path dir;
};

}  // namespace dcx::sandbox
