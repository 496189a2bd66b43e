#include <signal.h>
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

using namespace std;
using namespace dcx;
using namespace dcx::sandbox;

static result finished(int exit_code, const string &output) {
    result res;
    res.exit_code = exit_code;
    res.stdout_output = output;
    return res;
}

TEST(ClassifierTest, AcceptedOnExactMatch) {
    EXPECT_EQ(classify(finished(0, "3\n"), "3\n"), outcome::ACCEPTED);
}

TEST(ClassifierTest, WrongAnswerOnAnyByteDifference) {
    EXPECT_EQ(classify(finished(0, "3"), "3\n"), outcome::WRONG_ANSWER);
    EXPECT_EQ(classify(finished(0, "3\n\n"), "3\n"), outcome::WRONG_ANSWER);
    EXPECT_EQ(classify(finished(0, "3 \n"), "3\n"), outcome::WRONG_ANSWER);
    EXPECT_EQ(classify(finished(0, ""), "3\n"), outcome::WRONG_ANSWER);
}

TEST(ClassifierTest, RuntimeErrorBeatsWrongAnswer) {
    EXPECT_EQ(classify(finished(1, "3\n"), "3\n"), outcome::RUNTIME_ERROR);

    result res = finished(0, "");
    res.signal = SIGSEGV;
    EXPECT_EQ(classify(res, "3\n"), outcome::RUNTIME_ERROR);
}

TEST(ClassifierTest, TimeLimitBeatsRuntimeError) {
    result res = finished(0, "");
    res.signal = SIGKILL;
    res.timed_out = true;
    EXPECT_EQ(classify(res, "3\n"), outcome::TIME_LIMIT_EXCEEDED);
}

TEST(ClassifierTest, MemoryLimitBeatsTimeLimit) {
    result res = finished(137, "");
    res.oom_killed = true;
    res.timed_out = true;
    EXPECT_EQ(classify(res, "3\n"), outcome::MEMORY_LIMIT_EXCEEDED);
}

TEST(ClassifierTest, CompileErrorBeatsEverything) {
    result res = finished(1, "");
    res.oom_killed = true;
    EXPECT_EQ(classify(res, "3\n", true), outcome::COMPILE_ERROR);
    EXPECT_EQ(classify(finished(0, "3\n"), "3\n", true), outcome::COMPILE_ERROR);
}

TEST(ClassifierTest, SandboxFailureIsInternalError) {
    result res = finished(0, "3\n");
    res.error = "docker daemon is not running";
    EXPECT_EQ(classify(res, "3\n"), outcome::INTERNAL_ERROR);
    EXPECT_EQ(classify(res, "3\n", true), outcome::INTERNAL_ERROR);
}

TEST(ClassifierTest, CompileFailedCoversTimeoutAndMemory) {
    EXPECT_FALSE(finished(0, "").compile_failed());
    EXPECT_TRUE(finished(1, "").compile_failed());

    result timeout = finished(0, "");
    timeout.timed_out = true;
    EXPECT_TRUE(timeout.compile_failed());

    result oom = finished(0, "");
    oom.oom_killed = true;
    EXPECT_TRUE(oom.compile_failed());

    result broken = finished(1, "");
    broken.error = "unable to start";
    EXPECT_FALSE(broken.compile_failed());
}
