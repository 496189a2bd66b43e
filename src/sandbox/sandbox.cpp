#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/process_sandbox.hpp"

namespace dcx::sandbox {
using namespace std;

bool result::ok() const {
    return error.empty();
}

bool result::compile_failed() const {
    return ok() && (exit_code != 0 || signal != 0 || timed_out || oom_killed);
}

outcome classify(const result &res, const string &expected_output, bool compile_failed) {
    if (!res.ok()) return outcome::INTERNAL_ERROR;
    if (compile_failed) return outcome::COMPILE_ERROR;
    if (res.oom_killed) return outcome::MEMORY_LIMIT_EXCEEDED;
    if (res.timed_out) return outcome::TIME_LIMIT_EXCEEDED;
    if (res.exit_code != 0 || res.signal != 0) return outcome::RUNTIME_ERROR;
    if (res.stdout_output != expected_output) return outcome::WRONG_ANSWER;
    return outcome::ACCEPTED;
}

sandbox::~sandbox() = default;

result sandbox::run(const request &req) {
    result res;
    try {
        filesystem::path dir = req.workdir;
        bool staged = false;
        defer {
            if (staged && !DEBUG) remove_directory_quietly(dir);
        };

        if (!req.in_place) {
            // 运行目录与提交目录同级，避免并发的拷贝互相包含
            dir = req.workdir.parent_path() / (req.workdir.filename().string() + ".run-" + generate_uuid());
            staged = true;
            copy_directory(req.workdir, dir);
        }

        execute(req, dir, res);
    } catch (exception &e) {
        LOG(ERROR) << "Sandbox " << type() << " failed to run " << req.command << ": " << boost::diagnostic_information(e);
        res = result();
        res.error = e.what();
        if (res.error.empty()) res.error = "sandbox failure";
    }
    return res;
}

unique_ptr<sandbox> make_sandbox(const string &type) {
    if (type == "docker")
        return make_unique<docker_sandbox>();
    else if (type == "process")
        return make_unique<process_sandbox>(CGROUP_ROOT, ISOLATE_NAMESPACES);
    else
        throw invalid_argument("Unrecognized sandbox type " + type);
}

}  // namespace dcx::sandbox
