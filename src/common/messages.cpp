#include "common/messages.hpp"
#include "common/json_utils.hpp"

namespace dcx::message {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const test_case &value) {
    j = {{"id", value.id},
         {"input", value.input},
         {"expected_output", value.expected_output}};
}

void from_json(const json &j, test_case &value) {
    j.at("id").get_to(value.id);
    j.at("input").get_to(value.input);
    j.at("expected_output").get_to(value.expected_output);
}

void to_json(json &j, const verdict &value) {
    j = {{"test_case_id", value.test_case_id},
         {"outcome", value.result},
         {"actual_output", value.actual_output},
         {"stderr", value.stderr_output},
         {"exit_code", value.exit_code},
         {"duration_ms", value.duration_ms},
         {"peak_memory_mb", value.peak_memory_mb}};
}

void from_json(const json &j, verdict &value) {
    j.at("test_case_id").get_to(value.test_case_id);
    j.at("outcome").get_to(value.result);
    value.actual_output = get_value_def<string>(j, "", "actual_output");
    value.stderr_output = get_value_def<string>(j, "", "stderr");
    value.exit_code = get_value_def<int>(j, 0, "exit_code");
    value.duration_ms = get_value_def<int64_t>(j, 0, "duration_ms");
    value.peak_memory_mb = get_value_def<double>(j, 0, "peak_memory_mb");
}

void to_json(json &j, const assignment &value) {
    j = {{"job_id", value.job_id},
         {"attempt", value.attempt},
         {"language", value.language},
         {"source_code", value.source_code},
         {"test_cases", value.test_cases},
         {"time_limit_ms", value.time_limit_ms},
         {"memory_limit_mb", value.memory_limit_mb}};
}

void from_json(const json &j, assignment &value) {
    j.at("job_id").get_to(value.job_id);
    j.at("attempt").get_to(value.attempt);
    j.at("language").get_to(value.language);
    j.at("source_code").get_to(value.source_code);
    j.at("test_cases").get_to(value.test_cases);
    j.at("time_limit_ms").get_to(value.time_limit_ms);
    j.at("memory_limit_mb").get_to(value.memory_limit_mb);
}

void to_json(json &j, const worker_registration &value) {
    j = {{"id", value.id},
         {"address", value.address},
         {"capacity", value.capacity}};
}

void from_json(const json &j, worker_registration &value) {
    j.at("id").get_to(value.id);
    value.address = get_value_def<string>(j, "", "address");
    j.at("capacity").get_to(value.capacity);
}

void to_json(json &j, const worker_info &value) {
    j = {{"id", value.id},
         {"address", value.address},
         {"capacity", value.capacity},
         {"available_slots", value.available_slots},
         {"running_jobs", value.running_jobs},
         {"last_heartbeat_ms", value.last_heartbeat_ms}};
}

void from_json(const json &j, worker_info &value) {
    j.at("id").get_to(value.id);
    j.at("address").get_to(value.address);
    j.at("capacity").get_to(value.capacity);
    j.at("available_slots").get_to(value.available_slots);
    j.at("running_jobs").get_to(value.running_jobs);
    j.at("last_heartbeat_ms").get_to(value.last_heartbeat_ms);
}

void to_json(json &j, const job_progress &value) {
    j = {{"worker_id", value.worker_id},
         {"attempt", value.attempt},
         {"status", value.status}};
}

void from_json(const json &j, job_progress &value) {
    j.at("worker_id").get_to(value.worker_id);
    j.at("attempt").get_to(value.attempt);
    j.at("status").get_to(value.status);
}

void to_json(json &j, const verdict_batch &value) {
    j = {{"worker_id", value.worker_id},
         {"attempt", value.attempt},
         {"verdicts", value.verdicts}};
    if (value.compiler_output) j["compiler_output"] = *value.compiler_output;
}

void from_json(const json &j, verdict_batch &value) {
    j.at("worker_id").get_to(value.worker_id);
    j.at("attempt").get_to(value.attempt);
    if (exists(j, "compiler_output"))
        value.compiler_output = j.at("compiler_output").get<string>();
    else
        value.compiler_output.reset();
    j.at("verdicts").get_to(value.verdicts);
}

void to_json(json &j, const job_report &value) {
    j = {{"worker_id", value.worker_id},
         {"attempt", value.attempt}};
    if (!value.reason.empty()) j["reason"] = value.reason;
}

void from_json(const json &j, job_report &value) {
    j.at("worker_id").get_to(value.worker_id);
    j.at("attempt").get_to(value.attempt);
    value.reason = get_value_def<string>(j, "", "reason");
}

}  // namespace dcx::message
