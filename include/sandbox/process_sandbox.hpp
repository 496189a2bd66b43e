#pragma once

#include <cstdint>
#include <string>
#include "sandbox/sandbox.hpp"

namespace dcx::sandbox {

/**
 * @brief 直接在本机上 fork 执行命令的沙箱
 * 每次运行都在独立的进程组和一个全新的运行目录中进行，配置了 cgroup 时
 * 每次运行还会创建一个独立的 cgroup 来限制内存。
 * 没有 cgroup 时用 RLIMIT_AS 设置一个宽松的地址空间上限，内存超限在运行结束后
 * 根据内存峰值判定。
 * 不提供文件系统隔离，用于开发环境和测试。
 */
struct process_sandbox : public sandbox {
    /**
     * @param cgroup_root 父 cgroup 的名称，为空时不使用 cgroup
     * @param isolate_namespaces 是否隔离网络、IPC、UTS 命名空间
     */
    explicit process_sandbox(const std::string &cgroup_root = "", bool isolate_namespaces = false);

    std::string type() const override;

protected:
    void execute(const request &req, const std::filesystem::path &dir, result &res) override;

private:
    std::string cgroup_root;
    bool isolate_namespaces;
};

// 没有 cgroup 时，地址空间上限至少是内存限制的 ADDRESS_SPACE_FACTOR 倍，
// 并且至少比内存限制多 ADDRESS_SPACE_HEADROOM_MB，以容纳共享库和线程栈的映射
constexpr int64_t ADDRESS_SPACE_FACTOR = 4;
constexpr int ADDRESS_SPACE_HEADROOM_MB = 256;

/**
 * @brief 没有 cgroup 时子进程的地址空间上限（字节）
 */
int64_t address_space_ceiling(int memory_limit_mb);

}  // namespace dcx::sandbox
