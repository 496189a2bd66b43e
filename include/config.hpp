#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace dcx {

/**
 * @brief 提交的时间限制（毫秒）的默认值与取值范围
 * 超出范围的值会被截断到范围内，而不是拒绝提交
 */
constexpr int DEFAULT_TIME_LIMIT_MS = 2000;
constexpr int MIN_TIME_LIMIT_MS = 100;
constexpr int MAX_TIME_LIMIT_MS = 30000;

/**
 * @brief 提交的内存限制（MB）的默认值与取值范围
 */
constexpr int DEFAULT_MEMORY_LIMIT_MB = 128;
constexpr int MIN_MEMORY_LIMIT_MB = 16;
constexpr int MAX_MEMORY_LIMIT_MB = 1024;

/**
 * @brief 编译步骤的默认资源限制
 * 语言配置中可以单独覆盖
 */
constexpr int DEFAULT_COMPILE_TIME_LIMIT_MS = 60000;
constexpr int DEFAULT_COMPILE_MEMORY_LIMIT_MB = 1024;

/**
 * @brief 超时后等待进程组（或者容器）被杀死的宽限时间
 */
constexpr int KILL_GRACE_MS = 500;

/**
 * @brief 用户程序 stdout、stderr 各自最多保存的字节数，超出部分被丢弃
 * @defaultValue 16 MiB
 */
extern std::size_t OUTPUT_LIMIT_BYTES;

/**
 * @brief worker 存放提交的编译与运行目录
 *
 * RUN_DIR
 * ├── 3f2a...-1 // 提交编号-第几次分配
 * │   ├── main.cpp // 选手程序源代码
 * │   ├── main // 编译产物
 * │   └── run-xxxx // 每个测试点独立的运行目录，为上一层目录的完整拷贝
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief process 沙箱创建 cgroup 的父 cgroup，为相对于 cgroup 挂载点的名称，如 /dcx
 * 该 cgroup 需要委派给 worker 并启用 memory 控制器。
 * 为空时 process 沙箱不限制内存，只根据 ru_maxrss 事后判定内存超限，仅用于开发环境。
 */
extern std::string CGROUP_ROOT;

/**
 * @brief process 沙箱是否将用户程序放入新的网络、IPC、UTS 命名空间
 * 需要 CAP_SYS_ADMIN
 */
extern bool ISOLATE_NAMESPACES;

/**
 * @brief docker 命令的路径
 */
extern std::string DOCKER_BIN;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，worker 不会删除提交的运行目录，以便手动检查产生的文件。
 */
extern bool DEBUG;

}  // namespace dcx
