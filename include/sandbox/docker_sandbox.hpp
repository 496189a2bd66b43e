#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "sandbox/sandbox.hpp"

namespace dcx::sandbox {

/**
 * @brief 每次执行创建一个全新 docker 容器的沙箱
 * 容器禁用网络，内存上限通过 --memory 设置并禁止交换，
 * 内存超限通过容器状态中的 OOMKilled 判定。
 * 容器运行期间定时读取容器 cgroup 的内存统计，作为内存峰值。
 * 执行流程为 docker create → docker start -a -i → docker inspect → docker rm -f，
 * 容器在任何退出路径上都会被删除。
 */
struct docker_sandbox : public sandbox {
    std::string type() const override;

protected:
    void execute(const request &req, const std::filesystem::path &dir, result &res) override;
};

/**
 * @brief 解析 docker inspect 输出的 RFC 3339 时间，如 2024-01-01T12:00:00.123456789Z
 * @return 距离 epoch 的毫秒数，docker 表示未设置的时间 (0001-01-01T00:00:00Z) 或者格式错误时返回空
 */
std::optional<int64_t> parse_docker_time(const std::string &str);

/**
 * @brief 查找容器在 cgroup v2 层级中的目录
 * 兼容 systemd (system.slice/docker-<id>.scope) 和 cgroupfs (docker/<id>) 两种 cgroup 驱动
 * @param container_id 完整的容器 id
 * @return 容器尚未启动或已经退出时返回空路径
 */
std::filesystem::path find_container_cgroup(const std::string &container_id,
                                            const std::filesystem::path &cgroup_mount = "/sys/fs/cgroup");

/**
 * @brief 读取 cgroup 的内存使用（字节），优先使用 memory.peak，否则使用 memory.current
 * @return 统计文件不存在或者无法解析时返回 0
 */
int64_t read_cgroup_memory(const std::filesystem::path &dir);

}  // namespace dcx::sandbox
