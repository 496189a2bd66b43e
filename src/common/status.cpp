#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace dcx {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<job_status, const char *> job_status_string = boost::assign::map_list_of
    (job_status::PENDING, "pending")
    (job_status::ASSIGNED, "assigned")
    (job_status::COMPILING, "compiling")
    (job_status::RUNNING, "running")
    (job_status::COMPLETED, "completed")
    (job_status::FAILED, "failed");

static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::ACCEPTED, "accepted")
    (outcome::WRONG_ANSWER, "wrong_answer")
    (outcome::COMPILE_ERROR, "compile_error")
    (outcome::RUNTIME_ERROR, "runtime_error")
    (outcome::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (outcome::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (outcome::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(job_status stat) {
    return job_status_string.at(stat);
}

const char *get_display_message(outcome result) {
    return outcome_string.at(result);
}

job_status parse_job_status(const string &str) {
    for (auto &[key, value] : job_status_string)
        if (str == value) return key;
    throw invalid_argument("Unrecognized job status " + str);
}

outcome parse_outcome(const string &str) {
    for (auto &[key, value] : outcome_string)
        if (str == value) return key;
    throw invalid_argument("Unrecognized outcome " + str);
}

bool is_terminal(job_status stat) {
    return stat == job_status::COMPLETED || stat == job_status::FAILED;
}

void to_json(json &j, job_status stat) {
    j = get_display_message(stat);
}

void from_json(const json &j, job_status &stat) {
    stat = parse_job_status(j.get<string>());
}

void to_json(json &j, outcome result) {
    j = get_display_message(result);
}

void from_json(const json &j, outcome &result) {
    result = parse_outcome(j.get<string>());
}

}  // namespace dcx
