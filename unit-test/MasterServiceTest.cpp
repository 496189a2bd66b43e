#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "master/service.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace dcx;
using namespace dcx::master;
using namespace nlohmann;

class MasterServiceTest : public ::testing::Test {
protected:
    job_store store;
    worker_registry registry;
    scheduler_config sched_cfg;
    unique_ptr<scheduler> sched;
    unique_ptr<service> svc;

    void SetUp() override {
        sched_cfg.max_attempts = 2;
        sched = make_unique<scheduler>(store, registry, sched_cfg);
        svc = make_unique<service>(language::registry::builtin(), store, registry, *sched);
    }

    string submit(int test_cases = 2) {
        json body = {{"language", "cpp"}, {"source_code", "int main() {}"}, {"test_cases", json::array()}};
        for (int i = 0; i < test_cases; ++i)
            body["test_cases"].push_back({{"id", "t" + to_string(i)}, {"input", ""}, {"expected_output", ""}});
        return svc->submit(body);
    }

    void register_worker(const string &id, int capacity = 1) {
        json result = svc->register_worker({{"id", id}, {"address", "127.0.0.1"}, {"capacity", capacity}});
        EXPECT_EQ(result.at("heartbeat_interval_ms"), 2000);
    }

    /**
     * @brief 分配并拉取，返回分配给 worker 的第一个任务
     */
    json dispatch_to(const string &worker_id) {
        sched->dispatch();
        json assignments = svc->poll(worker_id).at("assignments");
        EXPECT_EQ(assignments.size(), 1u);
        return assignments.empty() ? json() : assignments[0];
    }

    static json report(const string &worker_id, int attempt) {
        return {{"worker_id", worker_id}, {"attempt", attempt}};
    }

    static json verdict(const string &id, const string &result) {
        return {{"test_case_id", id}, {"outcome", result}, {"actual_output", ""}, {"stderr", ""},
                {"exit_code", 0}, {"duration_ms", 3}, {"peak_memory_mb", 1.5}};
    }

    json verdicts(const string &worker_id, int attempt, const vector<json> &list) {
        json body = report(worker_id, attempt);
        body["verdicts"] = list;
        return body;
    }

    string status_of(const string &job_id) {
        return svc->status(job_id).at("status").get<string>();
    }
};

TEST_F(MasterServiceTest, FullProtocol) {
    string job_id = submit(2);
    register_worker("w1");

    json task = dispatch_to("w1");
    EXPECT_EQ(task.at("job_id"), job_id);
    EXPECT_EQ(task.at("attempt"), 1);
    EXPECT_EQ(task.at("language"), "cpp");
    EXPECT_EQ(task.at("time_limit_ms"), 2000);
    EXPECT_EQ(task.at("test_cases").size(), 2u);
    EXPECT_EQ(status_of(job_id), "assigned");

    svc->ack(job_id, report("w1", 1));
    svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "compiling"}});
    EXPECT_EQ(status_of(job_id), "compiling");

    json compiled = report("w1", 1);
    compiled["compiler_output"] = "warning: unused variable";
    compiled["verdicts"] = json::array();
    svc->record_verdicts(job_id, compiled);

    svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "running"}});
    EXPECT_EQ(status_of(job_id), "running");

    // 结果可以乱序到达，状态中按照测试点顺序排列
    json result = svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t1", "wrong_answer")}));
    EXPECT_JSON_EQ(result, json({{"recorded", 1}, {"duplicates", 0}}));
    svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "accepted")}));

    EXPECT_EQ(status_of(job_id), "running");
    svc->complete(job_id, report("w1", 1));

    json status = svc->status(job_id);
    EXPECT_EQ(status.at("status"), "completed");
    EXPECT_EQ(status.at("attempts"), 1);
    EXPECT_EQ(status.at("compiler_output"), "warning: unused variable");
    EXPECT_FALSE(status.contains("error"));
    ASSERT_EQ(status.at("verdicts").size(), 2u);
    EXPECT_EQ(status.at("verdicts")[0].at("test_case_id"), "t0");
    EXPECT_EQ(status.at("verdicts")[0].at("outcome"), "accepted");
    EXPECT_EQ(status.at("verdicts")[1].at("outcome"), "wrong_answer");
    EXPECT_EQ(status.at("verdicts")[1].at("peak_memory_mb"), 1.5);

    // 查询是幂等的
    EXPECT_JSON_EQ(svc->status(job_id), status);

    json workers = svc->workers();
    ASSERT_EQ(workers.size(), 1u);
    EXPECT_EQ(workers[0].at("available_slots"), 1);
    EXPECT_EQ(workers[0].at("running_jobs"), 0);
}

TEST_F(MasterServiceTest, InterpretedLanguageSkipsCompiling) {
    string job_id = svc->submit(R"json({"language": "python", "source_code": "print(1)",
        "test_cases": [{"id": "a", "input": "", "expected_output": "1\n"}]})json"_json);
    register_worker("w1");
    dispatch_to("w1");
    svc->ack(job_id, report("w1", 1));
    svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "running"}});
    EXPECT_EQ(status_of(job_id), "running");

    // 状态不会后退
    svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "compiling"}});
    EXPECT_EQ(status_of(job_id), "running");
}

TEST_F(MasterServiceTest, ProgressOnlyAcceptsCompilingOrRunning) {
    string job_id = submit();
    register_worker("w1");
    dispatch_to("w1");
    EXPECT_THROW_CODE(svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "completed"}}),
                      bad_request, "invalid_status");
    EXPECT_THROW_CODE(svc->progress(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"status", "bogus"}}),
                      bad_request, "invalid_request");
}

TEST_F(MasterServiceTest, DuplicateVerdictsIgnored) {
    string job_id = submit(1);
    register_worker("w1");
    dispatch_to("w1");

    svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "accepted")}));
    json result = svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "runtime_error")}));
    EXPECT_JSON_EQ(result, json({{"recorded", 0}, {"duplicates", 1}}));
    EXPECT_EQ(svc->status(job_id).at("verdicts")[0].at("outcome"), "accepted");
}

TEST_F(MasterServiceTest, InvalidVerdictsRejectedWithoutSideEffects) {
    string job_id = submit(2);
    register_worker("w1");
    dispatch_to("w1");

    EXPECT_THROW_CODE(svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "accepted"), verdict("t9", "accepted")})),
                      bad_request, "unknown_test_case");
    EXPECT_THROW_CODE(svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "internal_error")})),
                      bad_request, "invalid_verdict");
    EXPECT_THROW_CODE(svc->record_verdicts(job_id, {{"worker_id", "w1"}}), bad_request, "invalid_request");
    EXPECT_TRUE(svc->status(job_id).at("verdicts").empty());
}

TEST_F(MasterServiceTest, StaleReportsConflict) {
    string job_id = submit(1);
    register_worker("w1");
    register_worker("w2");
    // 两个 worker 空闲位置相同，编号小的 w1 优先
    dispatch_to("w1");
    string other = submit(1);
    dispatch_to("w2");

    EXPECT_THROW(svc->ack(job_id, report("w2", 1)), conflict);
    EXPECT_THROW(svc->ack(job_id, report("w1", 2)), conflict);

    svc->fail(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"reason", "docker daemon unavailable"}});
    EXPECT_EQ(status_of(job_id), "pending");

    json task = dispatch_to("w1");
    EXPECT_EQ(task.at("job_id"), job_id);
    EXPECT_EQ(task.at("attempt"), 2);

    // 旧的分配以及其他 worker 都不能再上报
    EXPECT_THROW(svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "accepted")})), conflict);
    EXPECT_THROW(svc->record_verdicts(job_id, verdicts("w2", 2, {verdict("t0", "accepted")})), conflict);
    EXPECT_THROW(svc->fail(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"reason", "late"}}), conflict);
    EXPECT_THROW(svc->complete(job_id, report("w1", 1)), conflict);
    EXPECT_TRUE(svc->status(job_id).at("verdicts").empty());
    EXPECT_EQ(status_of(job_id), "assigned");

    svc->record_verdicts(job_id, verdicts("w1", 2, {verdict("t0", "accepted")}));
    svc->complete(job_id, report("w1", 2));
    EXPECT_EQ(status_of(job_id), "completed");
    EXPECT_EQ(status_of(other), "assigned");

    // 提交结束之后的上报同样被拒绝
    EXPECT_THROW(svc->complete(job_id, report("w1", 2)), conflict);
}

TEST_F(MasterServiceTest, CompleteWithMissingVerdictsRetries) {
    string job_id = submit(2);
    register_worker("w1");
    dispatch_to("w1");
    svc->record_verdicts(job_id, verdicts("w1", 1, {verdict("t0", "accepted")}));

    svc->complete(job_id, report("w1", 1));
    EXPECT_EQ(status_of(job_id), "pending");

    json task = dispatch_to("w1");
    EXPECT_EQ(task.at("attempt"), 2);
    ASSERT_EQ(task.at("test_cases").size(), 1u);
    EXPECT_EQ(task.at("test_cases")[0].at("id"), "t1");

    svc->record_verdicts(job_id, verdicts("w1", 2, {verdict("t1", "time_limit_exceeded")}));
    svc->complete(job_id, report("w1", 2));

    json status = svc->status(job_id);
    EXPECT_EQ(status.at("status"), "completed");
    EXPECT_EQ(status.at("attempts"), 2);
    EXPECT_EQ(status.at("verdicts").size(), 2u);
}

TEST_F(MasterServiceTest, RepeatedFailureFailsJob) {
    string job_id = submit(1);
    register_worker("w1");
    dispatch_to("w1");
    svc->fail(job_id, {{"worker_id", "w1"}, {"attempt", 1}, {"reason", "image missing"}});
    dispatch_to("w1");
    svc->fail(job_id, {{"worker_id", "w1"}, {"attempt", 2}, {"reason", "image missing"}});

    json status = svc->status(job_id);
    EXPECT_EQ(status.at("status"), "failed");
    EXPECT_EQ(status.at("error"), "gave up after 2 attempts: image missing");
    EXPECT_EQ(svc->workers()[0].at("available_slots"), 1);
}

TEST_F(MasterServiceTest, UnknownWorkerMustRegister) {
    EXPECT_THROW_CODE(svc->heartbeat("ghost"), not_found, "worker_not_found");
    EXPECT_THROW_CODE(svc->poll("ghost"), not_found, "worker_not_found");
    register_worker("ghost");
    EXPECT_NO_THROW(svc->heartbeat("ghost"));
    EXPECT_TRUE(svc->poll("ghost").at("assignments").empty());
}

TEST_F(MasterServiceTest, InvalidRegistrationRejected) {
    EXPECT_THROW_CODE(svc->register_worker({{"id", ""}, {"address", "x"}, {"capacity", 1}}), bad_request, "invalid_request");
    EXPECT_THROW_CODE(svc->register_worker({{"id", "w"}, {"address", "x"}, {"capacity", 0}}), bad_request, "invalid_request");
    EXPECT_THROW_CODE(svc->register_worker({{"id", "w"}}), bad_request, "invalid_request");
}

TEST_F(MasterServiceTest, ReRegistrationRequeuesJobs) {
    string job_id = submit(1);
    register_worker("w1");
    dispatch_to("w1");
    svc->ack(job_id, report("w1", 1));

    register_worker("w1");
    EXPECT_EQ(status_of(job_id), "pending");
    EXPECT_THROW(svc->complete(job_id, report("w1", 1)), conflict);

    json task = dispatch_to("w1");
    EXPECT_EQ(task.at("attempt"), 2);
}

TEST_F(MasterServiceTest, JobEndpointsReportUnknownJobs) {
    EXPECT_THROW_CODE(svc->ack("missing", report("w1", 1)), not_found, "job_not_found");
    EXPECT_THROW_CODE(svc->complete("missing", report("w1", 1)), not_found, "job_not_found");
    EXPECT_THROW_CODE(svc->fail("missing", report("w1", 1)), not_found, "job_not_found");
}
