#include "worker/agent.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <optional>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace dcx::worker {
using namespace std;

static message::job_report make_report(const string &worker_id, int attempt, const string &reason = "") {
    message::job_report report;
    report.worker_id = worker_id;
    report.attempt = attempt;
    report.reason = reason;
    return report;
}

/**
 * @brief 一个提交的一次评测
 * 测试点线程共享这个对象，failure 和 abandoned 决定是否继续启动新的测试点。
 */
struct job_execution {
    const message::assignment &task;
    const string &worker_id;
    master_client &client;
    sandbox::sandbox &box;
    slot_pool &slots;
    const language::profile &profile;
    filesystem::path workdir;
    string tag;

    job_execution(const message::assignment &task, const string &worker_id, master_client &client,
                  sandbox::sandbox &box, slot_pool &slots, const language::profile &profile)
        : task(task), worker_id(worker_id), client(client), box(box), slots(slots), profile(profile) {
        workdir = RUN_DIR / fmt::format("{}-{}", task.job_id, task.attempt);
        tag = fmt::format("[{}#{}]", task.job_id, task.attempt);
    }

    bool should_stop() {
        scoped_lock guard(mut);
        return failure.has_value() || abandoned;
    }

    /**
     * @brief 记录基础设施错误，只保留第一个
     */
    void set_failure(const string &reason) {
        scoped_lock guard(mut);
        if (!failure) failure = reason;
    }

    void abandon(const string &reason) {
        scoped_lock guard(mut);
        if (!abandoned) LOG(WARNING) << tag << " abandoned: " << reason;
        abandoned = true;
    }

    /**
     * @brief 上报评测结果
     * 提交已经被重新分配时放弃评测，其他上报失败视为基础设施错误
     */
    void post(const message::verdict_batch &batch) {
        try {
            client.verdicts(task.job_id, batch);
        } catch (conflict &e) {
            abandon(e.what());
        } catch (not_found &e) {
            abandon(e.what());
        } catch (dcx_exception &e) {
            LOG(ERROR) << tag << " unable to report verdicts: " << e;
            set_failure(string("unable to report verdicts: ") + e.what());
        } catch (exception &e) {
            LOG(ERROR) << tag << " unable to report verdicts: " << boost::diagnostic_information(e);
            set_failure(string("unable to report verdicts: ") + e.what());
        }
    }

    message::verdict_batch make_batch() const {
        message::verdict_batch batch;
        batch.worker_id = worker_id;
        batch.attempt = task.attempt;
        return batch;
    }

    void prepare() {
        error_code ec;
        filesystem::remove_all(workdir, ec);
        filesystem::create_directories(workdir, ec);
        if (ec) throw internal_error(fmt::format("unable to create {}: {}", workdir.string(), ec.message()));
        write_file_content(workdir / profile.source_file, task.source_code);
    }

    /**
     * @brief 编译提交
     * @return 编译是否成功，失败时已经为每个测试点上报了 compile_error
     */
    bool compile() {
        client.progress(task.job_id, {worker_id, task.attempt, job_status::COMPILING});

        sandbox::request req;
        req.command = *profile.compile_cmd;
        req.workdir = workdir;
        req.image = profile.compile_image.value_or(profile.run_image);
        req.time_limit_ms = profile.compile_time_limit_ms;
        req.memory_limit_mb = profile.compile_memory_limit_mb;
        req.in_place = true;

        sandbox::result res = box.run(req);
        if (!res.ok()) {
            set_failure("compilation failed to start: " + res.error);
            return false;
        }

        message::verdict_batch batch = make_batch();
        batch.compiler_output = res.stdout_output + res.stderr_output;

        if (!res.compile_failed()) {
            DLOG(INFO) << tag << " compiled in " << res.duration_ms << "ms";
            post(batch);
            return true;
        }

        LOG(INFO) << tag << " compilation failed";
        for (auto &tc : task.test_cases) {
            message::verdict v;
            v.test_case_id = tc.id;
            v.result = sandbox::classify(res, tc.expected_output, true);
            v.stderr_output = *batch.compiler_output;
            v.exit_code = res.signal ? 128 + res.signal : res.exit_code;
            v.duration_ms = res.duration_ms;
            v.peak_memory_mb = res.peak_memory_mb;
            batch.verdicts.push_back(v);
        }
        post(batch);
        return false;
    }

    /**
     * @brief 运行一个测试点，调用者已经获取了执行位置
     */
    void run_test_case(const message::test_case &tc) {
        slot_guard slot(slots);

        sandbox::request req;
        req.command = profile.run_cmd;
        req.workdir = workdir;
        req.image = profile.run_image;
        req.time_limit_ms = task.time_limit_ms;
        req.memory_limit_mb = task.memory_limit_mb;
        req.input = tc.input;
        req.in_place = false;

        sandbox::result res = box.run(req);
        outcome result = sandbox::classify(res, tc.expected_output);
        if (result == outcome::INTERNAL_ERROR) {
            LOG(ERROR) << tag << " test case " << tc.id << " failed to run: " << res.error;
            set_failure(fmt::format("test case {} failed to run: {}", tc.id, res.error));
            return;
        }

        message::verdict v;
        v.test_case_id = tc.id;
        v.result = result;
        v.actual_output = res.stdout_output;
        v.stderr_output = res.stderr_output;
        v.exit_code = res.signal ? 128 + res.signal : res.exit_code;
        v.duration_ms = res.duration_ms;
        v.peak_memory_mb = res.peak_memory_mb;
        DLOG(INFO) << tag << " test case " << tc.id << ": " << get_display_message(result);

        message::verdict_batch batch = make_batch();
        batch.verdicts.push_back(v);
        post(batch);
    }

    /**
     * @brief 依次为每个测试点获取执行位置并启动运行线程
     * 出现基础设施错误后不再启动新的测试点，等待已经启动的测试点结束
     */
    void run_test_cases() {
        client.progress(task.job_id, {worker_id, task.attempt, job_status::RUNNING});

        vector<thread> threads;
        defer {
            for (auto &t : threads)
                if (t.joinable()) t.join();
        };

        for (auto &tc : task.test_cases) {
            if (should_stop()) break;
            slots.acquire();
            if (should_stop()) {
                slots.release();
                break;
            }
            try {
                threads.emplace_back([this, &tc] {
                    try {
                        run_test_case(tc);
                    } catch (exception &e) {
                        LOG(ERROR) << tag << " test case " << tc.id << " failed: " << boost::diagnostic_information(e);
                        set_failure(fmt::format("test case {} failed: {}", tc.id, e.what()));
                    }
                });
            } catch (system_error &e) {
                slots.release();
                set_failure(string("unable to start test case thread: ") + e.what());
                break;
            }
        }
    }

    /**
     * @brief 评测提交并上报完成或者失败
     */
    void run() {
        defer {
            if (!DEBUG) remove_directory_quietly(workdir);
        };

        try {
            prepare();
            bool compiled = profile.compiles() ? compile() : true;
            if (compiled && !should_stop()) run_test_cases();
        } catch (conflict &e) {
            abandon(e.what());
        } catch (not_found &e) {
            abandon(e.what());
        } catch (exception &e) {
            LOG(ERROR) << tag << " failed: " << boost::diagnostic_information(e);
            set_failure(e.what());
        }

        optional<string> reason;
        {
            scoped_lock guard(mut);
            if (abandoned) return;
            reason = failure;
        }

        if (reason) {
            LOG(WARNING) << tag << " reporting failure: " << *reason;
            client.fail(task.job_id, make_report(worker_id, task.attempt, *reason));
        } else {
            LOG(INFO) << tag << " finished";
            client.complete(task.job_id, make_report(worker_id, task.attempt));
        }
    }

private:
    mutex mut;
    optional<string> failure;
    bool abandoned = false;
};

agent::agent(master_client &client, sandbox::sandbox &box,
             shared_ptr<const language::registry> languages, agent_config config)
    : client(client), box(box), languages(move(languages)), cfg(move(config)),
      slots(cfg.capacity), heartbeat_interval_ms((int)cfg.heartbeat_interval.count()) {
    if (cfg.worker_id.empty()) cfg.worker_id = generate_uuid();
}

agent::~agent() {
    stop();
}

const string &agent::id() const {
    return cfg.worker_id;
}

void agent::start() {
    if (!register_self()) return;

    scoped_lock guard(mut);
    if (stopping) return;
    heartbeat_thread = thread([this] { heartbeat_loop(); });
    poll_thread = thread([this] { poll_loop(); });
}

void agent::stop() {
    thread poller, heartbeater;
    {
        scoped_lock guard(mut);
        stopping = true;
        poller = move(poll_thread);
        heartbeater = move(heartbeat_thread);
    }
    cv.notify_all();
    if (poller.joinable()) poller.join();

    // 正在评测的提交需要心跳维持，最后再停止心跳
    wait_jobs();

    {
        scoped_lock guard(mut);
        shutting_down = true;
    }
    cv.notify_all();
    if (heartbeater.joinable()) heartbeater.join();
}

bool agent::register_self() {
    message::worker_registration registration;
    registration.id = id();
    registration.address = cfg.address;
    registration.capacity = slots.capacity();

    while (true) {
        try {
            int interval = client.register_worker(registration);
            if (interval > 0) heartbeat_interval_ms = interval;
            need_register = false;
            LOG(INFO) << "Worker " << id() << " registered with capacity " << registration.capacity;
            return true;
        } catch (dcx_exception &e) {
            LOG(WARNING) << "Unable to register worker " << id() << ": " << e.what();
        }
        if (sleep_for(cfg.register_retry_interval, stopping)) return false;
    }
}

size_t agent::poll_once() {
    reap_jobs(false);

    size_t started = 0;
    for (auto &task : client.poll(id())) {
        // 先创建线程再确认，线程创建失败时提交没有被确认，会在确认超时后由 master 重新分配
        auto done = make_shared<atomic<bool>>(false);
        try {
            scoped_lock guard(mut);
            jobs.push_back({thread([this, task, done] {
                                if (acknowledge(task)) run_job(task);
                                *done = true;
                            }),
                            done});
        } catch (system_error &e) {
            LOG(ERROR) << "[" << task.job_id << "#" << task.attempt << "] unable to start job thread: " << e.what();
            continue;
        }
        ++started;
    }
    return started;
}

bool agent::acknowledge(const message::assignment &task) {
    try {
        client.ack(task.job_id, make_report(id(), task.attempt));
    } catch (dcx_exception &e) {
        // 未确认的提交会在确认超时后由 master 重新分配
        LOG(WARNING) << "[" << task.job_id << "#" << task.attempt << "] unable to acknowledge: " << e.what();
        return false;
    }
    LOG(INFO) << "[" << task.job_id << "#" << task.attempt << "] accepted, language " << task.language
              << ", " << task.test_cases.size() << " test cases";
    return true;
}

void agent::run_job(const message::assignment &task) {
    try {
        const language::profile *profile = languages->find(task.language);
        if (!profile) {
            LOG(ERROR) << "[" << task.job_id << "#" << task.attempt << "] unsupported language " << task.language;
            client.fail(task.job_id, make_report(id(), task.attempt, "unsupported language " + task.language));
            return;
        }

        job_execution execution(task, id(), client, box, slots, *profile);
        execution.run();
    } catch (conflict &e) {
        LOG(WARNING) << "[" << task.job_id << "#" << task.attempt << "] report rejected: " << e.what();
    } catch (not_found &e) {
        LOG(WARNING) << "[" << task.job_id << "#" << task.attempt << "] job no longer exists: " << e.what();
    } catch (exception &e) {
        LOG(ERROR) << "[" << task.job_id << "#" << task.attempt << "] unable to report result: "
                   << boost::diagnostic_information(e);
    }
}

size_t agent::running_jobs() const {
    scoped_lock guard(mut);
    size_t count = 0;
    for (auto &j : jobs)
        if (!*j.done) ++count;
    return count;
}

void agent::wait_jobs() {
    reap_jobs(true);
}

void agent::reap_jobs(bool all) {
    list<job_thread> finished;
    {
        scoped_lock guard(mut);
        for (auto it = jobs.begin(); it != jobs.end();) {
            auto next = std::next(it);
            if (all || *it->done) finished.splice(finished.end(), jobs, it);
            it = next;
        }
    }
    for (auto &j : finished)
        if (j.thread.joinable()) j.thread.join();
}

bool agent::sleep_for(chrono::milliseconds duration, const bool &flag) {
    unique_lock<mutex> lock(mut);
    return cv.wait_for(lock, duration, [&] { return flag; });
}

void agent::heartbeat_loop() {
    while (!sleep_for(chrono::milliseconds(heartbeat_interval_ms.load()), shutting_down)) {
        try {
            client.heartbeat(id());
        } catch (not_found &e) {
            LOG(WARNING) << "Worker " << id() << " is unknown to master, registering again";
            need_register = true;
        } catch (exception &e) {
            LOG(ERROR) << "Heartbeat failed: " << e.what();
        }
    }
}

void agent::poll_loop() {
    while (!sleep_for(cfg.poll_interval, stopping)) {
        if (need_register && !register_self()) break;
        try {
            poll_once();
        } catch (not_found &e) {
            LOG(WARNING) << "Worker " << id() << " is unknown to master, registering again";
            need_register = true;
        } catch (exception &e) {
            LOG(ERROR) << "Unable to poll master: " << boost::diagnostic_information(e);
        }
    }
}

}  // namespace dcx::worker
