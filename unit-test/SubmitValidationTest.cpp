#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "master/service.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace dcx;
using namespace dcx::master;
using namespace nlohmann;

class SubmitValidationTest : public ::testing::Test {
protected:
    job_store store;
    worker_registry registry;
    scheduler sched{store, registry};
    service_config cfg;
    unique_ptr<service> svc;

    void SetUp() override {
        cfg.max_test_cases = 3;
        svc = make_unique<service>(language::registry::builtin(), store, registry, sched, cfg);
    }

    static json valid_body() {
        return R"json({
            "language": "python",
            "source_code": "print(input())",
            "test_cases": [{"id": "1", "input": "a\n", "expected_output": "a\n"}]
        })json"_json;
    }

    void expect_rejected(const json &body, const string &code) {
        EXPECT_THROW_CODE(svc->submit(body), bad_request, code);
        EXPECT_EQ(store.size(), 0u) << body.dump();
        EXPECT_EQ(sched.pending_size(), 0u);
    }

    shared_ptr<job> submitted(const json &body) {
        string id = svc->submit(body);
        auto j = store.find(id);
        EXPECT_NE(j, nullptr);
        return j;
    }
};

TEST_F(SubmitValidationTest, ValidSubmissionCreatesPendingJob) {
    auto j = submitted(valid_body());
    ASSERT_NE(j, nullptr);
    EXPECT_EQ(j->language, "python");
    EXPECT_EQ(j->time_limit_ms, 2000);
    EXPECT_EQ(j->memory_limit_mb, 128);
    ASSERT_EQ(j->test_cases.size(), 1u);
    EXPECT_EQ(j->test_cases[0].expected_output, "a\n");
    EXPECT_EQ(sched.pending_size(), 1u);

    json status = svc->status(j->id);
    EXPECT_EQ(status.at("status"), "pending");
    EXPECT_JSON_EQ(status.at("verdicts"), json::array());
}

TEST_F(SubmitValidationTest, BodyMustBeObject) {
    expect_rejected(json::array(), "invalid_json");
    expect_rejected("submit", "invalid_json");
}

TEST_F(SubmitValidationTest, UnknownLanguage) {
    json body = valid_body();
    body["language"] = "cobol";
    expect_rejected(body, "unknown_language");
    body.erase("language");
    expect_rejected(body, "unknown_language");
    body["language"] = 3;
    expect_rejected(body, "unknown_language");
}

TEST_F(SubmitValidationTest, SourceCodeMustBeNonEmptyString) {
    json body = valid_body();
    body["source_code"] = "";
    expect_rejected(body, "invalid_source_code");
    body["source_code"] = json::array();
    expect_rejected(body, "invalid_source_code");
    body.erase("source_code");
    expect_rejected(body, "invalid_source_code");
}

TEST_F(SubmitValidationTest, TestCasesMustBeNonEmptyArrayOfObjects) {
    json body = valid_body();
    body["test_cases"] = json::array();
    expect_rejected(body, "invalid_test_cases");
    body["test_cases"] = json::object();
    expect_rejected(body, "invalid_test_cases");
    body["test_cases"] = R"(["1"])"_json;
    expect_rejected(body, "invalid_test_cases");
    body["test_cases"] = R"([{"id": "1", "input": 1, "expected_output": ""}])"_json;
    expect_rejected(body, "invalid_test_cases");
    body["test_cases"] = R"([{"id": "1", "input": ""}])"_json;
    expect_rejected(body, "invalid_test_cases");
    body["test_cases"] = R"([{"id": "", "input": "", "expected_output": ""}])"_json;
    expect_rejected(body, "invalid_test_cases");
}

TEST_F(SubmitValidationTest, DuplicateTestCaseId) {
    json body = valid_body();
    body["test_cases"].push_back(body["test_cases"][0]);
    expect_rejected(body, "duplicate_test_case_id");
}

TEST_F(SubmitValidationTest, TooManyTestCases) {
    json body = valid_body();
    body["test_cases"] = json::array();
    for (int i = 0; i < 4; ++i)
        body["test_cases"].push_back({{"id", to_string(i)}, {"input", ""}, {"expected_output", ""}});
    expect_rejected(body, "too_many_test_cases");

    body["test_cases"].erase(3);
    EXPECT_NE(submitted(body), nullptr);
}

TEST_F(SubmitValidationTest, LimitsAreClamped) {
    json body = valid_body();
    body["time_limit_ms"] = 5;
    body["memory_limit_mb"] = 1000000;
    auto j = submitted(body);
    EXPECT_EQ(j->time_limit_ms, 100);
    EXPECT_EQ(j->memory_limit_mb, 1024);

    body["time_limit_ms"] = 99999999999LL;
    body["memory_limit_mb"] = -5;
    j = submitted(body);
    EXPECT_EQ(j->time_limit_ms, 30000);
    EXPECT_EQ(j->memory_limit_mb, 16);

    body["time_limit_ms"] = 1500;
    body["memory_limit_mb"] = 256;
    j = submitted(body);
    EXPECT_EQ(j->time_limit_ms, 1500);
    EXPECT_EQ(j->memory_limit_mb, 256);
}

TEST_F(SubmitValidationTest, NonIntegerLimitsRejected) {
    json body = valid_body();
    body["time_limit_ms"] = "1000";
    expect_rejected(body, "invalid_limit");
    body["time_limit_ms"] = 1.5;
    expect_rejected(body, "invalid_limit");
    body.erase("time_limit_ms");
    body["memory_limit_mb"] = true;
    expect_rejected(body, "invalid_limit");
}

TEST_F(SubmitValidationTest, UnknownJobNotFound) {
    EXPECT_THROW_CODE(svc->status("00000000-0000-0000-0000-000000000000"), not_found, "job_not_found");
}
