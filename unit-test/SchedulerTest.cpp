#include <thread>
#include "gtest/gtest.h"
#include "master/scheduler.hpp"

using namespace std;
using namespace dcx;
using namespace dcx::master;

class SchedulerTest : public ::testing::Test {
protected:
    job_store store;
    worker_registry registry;
    scheduler_config cfg;
    unique_ptr<scheduler> sched;

    void SetUp() override {
        cfg.ack_timeout = chrono::milliseconds(50);
        cfg.heartbeat_timeout = chrono::milliseconds(50);
        cfg.max_attempts = 2;
        sched = make_unique<scheduler>(store, registry, cfg);
    }

    shared_ptr<job> submit(int test_cases = 2) {
        vector<message::test_case> cases;
        for (int i = 0; i < test_cases; ++i)
            cases.push_back({"t" + to_string(i), "", ""});
        auto j = store.create("python", "print()", cases, 1000, 64);
        sched->enqueue(j);
        return j;
    }

    void add_worker(const string &id, int capacity) {
        message::worker_registration reg;
        reg.id = id;
        reg.address = id;
        reg.capacity = capacity;
        registry.register_worker(reg);
    }

    static job_status status_of(const shared_ptr<job> &j) {
        scoped_lock guard(j->mut);
        return j->status;
    }

    static void acknowledge(const shared_ptr<job> &j) {
        scoped_lock guard(j->mut);
        j->acknowledged = true;
    }

    static void record(const shared_ptr<job> &j, const string &test_case_id) {
        message::verdict v;
        v.test_case_id = test_case_id;
        v.result = outcome::ACCEPTED;
        scoped_lock guard(j->mut);
        j->record_verdict(v);
    }
};

TEST_F(SchedulerTest, NothingHappensWithoutWorkers) {
    auto j = submit();
    EXPECT_EQ(sched->dispatch(), 0u);
    EXPECT_EQ(sched->pending_size(), 1u);
    EXPECT_EQ(status_of(j), job_status::PENDING);
}

TEST_F(SchedulerTest, DispatchInSubmissionOrder) {
    auto first = submit();
    auto second = submit();
    auto third = submit();
    add_worker("w1", 2);

    EXPECT_EQ(sched->dispatch(), 2u);
    EXPECT_EQ(status_of(first), job_status::ASSIGNED);
    EXPECT_EQ(status_of(second), job_status::ASSIGNED);
    EXPECT_EQ(status_of(third), job_status::PENDING);
    EXPECT_EQ(sched->pending_size(), 1u);

    auto tasks = registry.take_assignments("w1");
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 2u);
    EXPECT_EQ((*tasks)[0].job_id, first->id);
    EXPECT_EQ((*tasks)[0].attempt, 1);
    EXPECT_EQ((*tasks)[0].test_cases.size(), 2u);
    EXPECT_EQ((*tasks)[1].job_id, second->id);

    scoped_lock guard(first->mut);
    EXPECT_EQ(first->worker_id, "w1");
    EXPECT_EQ(first->attempts, 1);
}

TEST_F(SchedulerTest, RequeuedJobKeepsItsPosition) {
    auto first = submit();
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);
    auto second = submit();

    sched->retry(first, 1, "sandbox crashed");
    EXPECT_EQ(status_of(first), job_status::PENDING);

    ASSERT_EQ(sched->dispatch(), 1u);
    EXPECT_EQ(status_of(first), job_status::ASSIGNED);
    EXPECT_EQ(status_of(second), job_status::PENDING);

    scoped_lock guard(first->mut);
    EXPECT_EQ(first->attempts, 2);
}

TEST_F(SchedulerTest, RetryCarriesOnlyMissingTestCases) {
    auto j = submit(3);
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);
    registry.take_assignments("w1");
    record(j, "t1");

    sched->retry(j, 1, "worker failed");
    ASSERT_EQ(sched->dispatch(), 1u);

    auto tasks = registry.take_assignments("w1");
    ASSERT_EQ(tasks->size(), 1u);
    auto &task = (*tasks)[0];
    EXPECT_EQ(task.attempt, 2);
    ASSERT_EQ(task.test_cases.size(), 2u);
    EXPECT_EQ(task.test_cases[0].id, "t0");
    EXPECT_EQ(task.test_cases[1].id, "t2");
}

TEST_F(SchedulerTest, RetryExhaustionFailsJob) {
    auto j = submit();
    add_worker("w1", 1);

    ASSERT_EQ(sched->dispatch(), 1u);
    sched->retry(j, 1, "sandbox crashed");
    ASSERT_EQ(sched->dispatch(), 1u);
    sched->retry(j, 2, "sandbox crashed again");

    EXPECT_EQ(status_of(j), job_status::FAILED);
    EXPECT_EQ(sched->pending_size(), 0u);
    {
        scoped_lock guard(j->mut);
        EXPECT_EQ(j->error, "gave up after 2 attempts: sandbox crashed again");
        EXPECT_TRUE(j->worker_id.empty());
    }
    // 位置已经释放
    EXPECT_EQ(registry.snapshot()[0].available_slots, 1);
}

TEST_F(SchedulerTest, RetryWithEveryVerdictCompletes) {
    auto j = submit(2);
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);
    record(j, "t0");
    record(j, "t1");

    sched->retry(j, 1, "connection lost before completion");
    EXPECT_EQ(status_of(j), job_status::COMPLETED);
    EXPECT_EQ(sched->pending_size(), 0u);
}

TEST_F(SchedulerTest, StaleRetryIgnored) {
    auto j = submit();
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);
    sched->retry(j, 1, "first failure");
    ASSERT_EQ(sched->dispatch(), 1u);

    // 第一次分配的失败再次到达
    sched->retry(j, 1, "first failure again");
    EXPECT_EQ(status_of(j), job_status::ASSIGNED);
    scoped_lock guard(j->mut);
    EXPECT_EQ(j->attempts, 2);
}

TEST_F(SchedulerTest, AckTimeoutRequeues) {
    auto acked = submit();
    auto silent = submit();
    add_worker("w1", 2);
    ASSERT_EQ(sched->dispatch(), 2u);
    acknowledge(acked);

    this_thread::sleep_for(chrono::milliseconds(80));
    registry.heartbeat("w1");
    sched->check_timeouts();

    EXPECT_EQ(status_of(acked), job_status::ASSIGNED);
    EXPECT_EQ(status_of(silent), job_status::PENDING);
    EXPECT_EQ(sched->pending_size(), 1u);
    EXPECT_EQ(registry.snapshot()[0].available_slots, 1);
}

TEST_F(SchedulerTest, EvictionReassignsJobs) {
    auto j = submit();
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);
    acknowledge(j);

    this_thread::sleep_for(chrono::milliseconds(80));
    add_worker("w2", 1);
    sched->check_timeouts();

    EXPECT_FALSE(registry.contains("w1"));
    EXPECT_EQ(status_of(j), job_status::PENDING);

    ASSERT_EQ(sched->dispatch(), 1u);
    scoped_lock guard(j->mut);
    EXPECT_EQ(j->worker_id, "w2");
    EXPECT_EQ(j->attempts, 2);
}

TEST_F(SchedulerTest, ReassignSkipsJobsMovedElsewhere) {
    auto j = submit();
    add_worker("w1", 1);
    ASSERT_EQ(sched->dispatch(), 1u);

    sched->reassign("w2", {j->id}, "w2 restarted");
    EXPECT_EQ(status_of(j), job_status::ASSIGNED);

    sched->reassign("w1", {j->id}, "w1 restarted");
    EXPECT_EQ(status_of(j), job_status::PENDING);
}

TEST_F(SchedulerTest, PurgedJobsLeaveQueue) {
    auto j = submit();
    {
        scoped_lock guard(j->mut);
        j->set_status(job_status::FAILED);
    }
    this_thread::sleep_for(chrono::milliseconds(5));
    store.purge(chrono::seconds(0));
    add_worker("w1", 1);

    EXPECT_EQ(sched->dispatch(), 0u);
    EXPECT_EQ(sched->pending_size(), 0u);
    EXPECT_EQ(registry.snapshot()[0].available_slots, 1);
}

TEST_F(SchedulerTest, BackgroundThreadDispatches) {
    sched->start();
    auto j = submit();
    add_worker("w1", 1);
    sched->notify();

    for (int i = 0; i < 100 && status_of(j) == job_status::PENDING; ++i)
        this_thread::sleep_for(chrono::milliseconds(10));
    EXPECT_EQ(status_of(j), job_status::ASSIGNED);
    sched->stop();
}
