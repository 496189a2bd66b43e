#include "sandbox/docker_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cctype>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/process.hpp"

namespace dcx::sandbox {
using namespace std;
using namespace nlohmann;

// 容器启动需要的时间不计入程序运行时间，程序的运行时间以容器状态中的时间戳为准
const int CONTAINER_START_GRACE_MS = 2000;

// docker 的管理命令（create、inspect）的时间限制
const chrono::milliseconds DOCKER_COMMAND_TIMEOUT(30000);

const int PIDS_LIMIT = 64;

// 容器运行期间读取内存统计的间隔
const chrono::milliseconds MEMORY_SAMPLE_INTERVAL(10);

optional<int64_t> parse_docker_time(const string &str) {
    struct tm tm = {};
    int consumed = 0;
    if (sscanf(str.c_str(), "%d-%d-%dT%d:%d:%d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
               &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        return nullopt;
    if (tm.tm_year < 1970) return nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    int64_t millis = 0;
    if ((size_t)consumed < str.size() && str[consumed] == '.') {
        int digits = 0;
        for (size_t i = consumed + 1; i < str.size() && isdigit(str[i]); ++i, ++digits)
            if (digits < 3) millis = millis * 10 + (str[i] - '0');
        for (; digits < 3; ++digits) millis *= 10;
    }
    return (int64_t)timegm(&tm) * 1000 + millis;
}

filesystem::path find_container_cgroup(const string &container_id, const filesystem::path &cgroup_mount) {
    if (container_id.empty()) return {};
    for (auto &dir : {cgroup_mount / "system.slice" / ("docker-" + container_id + ".scope"),
                      cgroup_mount / "docker" / container_id}) {
        error_code ec;
        if (filesystem::is_directory(dir, ec)) return dir;
    }
    return {};
}

static int64_t read_counter(const filesystem::path &file) {
    ifstream fin(file);
    int64_t value = 0;
    if (fin >> value) return value;
    return 0;
}

int64_t read_cgroup_memory(const filesystem::path &dir) {
    int64_t peak = read_counter(dir / "memory.peak");
    if (peak > 0) return peak;
    return read_counter(dir / "memory.current");
}

static string trim(const string &str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

static process_result docker(const vector<string> &args, chrono::milliseconds timeout, const string &input = "") {
    process_options opt;
    opt.argv.push_back(DOCKER_BIN);
    opt.argv.insert(opt.argv.end(), args.begin(), args.end());
    opt.timeout = timeout;
    opt.input = input;
    return run_process(opt);
}

string docker_sandbox::type() const {
    return "docker";
}

void docker_sandbox::execute(const request &req, const filesystem::path &dir, result &res) {
    string name = "dcx-" + generate_uuid();
    string memory = fmt::format("{}m", req.memory_limit_mb);

    // clang-format off
    process_result created = docker({
        "create", "--name", name, "--pull", "never",
        "--network", "none",
        "--memory", memory, "--memory-swap", memory,
        "--pids-limit", to_string(PIDS_LIMIT),
        "--cpus", "1",
        "-i",
        "-v", filesystem::absolute(dir).string() + ":/sandbox",
        "-w", "/sandbox",
        req.image, "sh", "-c", req.command
    }, DOCKER_COMMAND_TIMEOUT);
    // clang-format on
    if (created.timed_out || created.exit_code != 0)
        throw internal_error(fmt::format("docker create {} failed: {}", req.image, created.stderr_output));

    defer {
        if (call_process(DOCKER_BIN, "rm", "-f", name) != 0)
            LOG(WARNING) << "Unable to remove container " << name;
    };

    // 容器退出后 cgroup 随之删除，因此只能在运行期间采样
    string container_id = trim(created.stdout_output);
    atomic<bool> running{true};
    atomic<int64_t> peak_memory{0};
    thread sampler([&] {
        filesystem::path dir;
        while (running) {
            if (dir.empty()) dir = find_container_cgroup(container_id);
            if (!dir.empty()) {
                int64_t usage = read_cgroup_memory(dir);
                if (usage > peak_memory) peak_memory = usage;
            }
            this_thread::sleep_for(MEMORY_SAMPLE_INTERVAL);
        }
    });
    auto stop_sampler = [&] {
        running = false;
        if (sampler.joinable()) sampler.join();
    };
    defer { stop_sampler(); };

    process_result started = docker({"start", "-a", "-i", name},
                                    chrono::milliseconds(req.time_limit_ms + CONTAINER_START_GRACE_MS),
                                    req.input.value_or(""));
    stop_sampler();
    if (started.timed_out) {
        DLOG(INFO) << "Container " << name << " exceeded time limit, killing";
        if (call_process(DOCKER_BIN, "kill", name) != 0)
            LOG(INFO) << "Container " << name << " already stopped before docker kill";
    }

    process_result inspected = docker({"inspect", "--format", "{{json .State}}", name}, DOCKER_COMMAND_TIMEOUT);
    if (inspected.timed_out || inspected.exit_code != 0)
        throw internal_error(fmt::format("docker inspect {} failed: {}", name, inspected.stderr_output));

    json state;
    try {
        state = json::parse(inspected.stdout_output);
    } catch (json::exception &e) {
        throw internal_error(fmt::format("Malformed container state of {}: {}", name, e.what()));
    }

    optional<int64_t> started_at = parse_docker_time(get_value_def<string>(state, "", "StartedAt"));
    optional<int64_t> finished_at = parse_docker_time(get_value_def<string>(state, "", "FinishedAt"));
    if (!started_at && !started.timed_out)
        throw internal_error(fmt::format("container {} did not start: {}", name, started.stderr_output));

    res.stdout_output = move(started.stdout_output);
    res.stderr_output = move(started.stderr_output);
    res.exit_code = get_value_def<int>(state, 0, "ExitCode");
    res.oom_killed = get_value_def<bool>(state, false, "OOMKilled");
    res.duration_ms = started_at && finished_at && *finished_at >= *started_at
                          ? *finished_at - *started_at
                          : started.duration_ms;
    res.timed_out = started.timed_out || res.duration_ms > req.time_limit_ms;
    if (started.timed_out && res.exit_code == 0) res.exit_code = 137;
    // 找不到容器的 cgroup 时（如 cgroup v1）峰值为 0
    res.peak_memory_mb = (double)peak_memory / (1 << 20);
}

}  // namespace dcx::sandbox
