#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/utils.hpp"
#include "config.hpp"
#include "language/profile.hpp"
#include "sandbox/sandbox.hpp"
#include "worker/agent.hpp"
#include "worker/master_client.hpp"
using namespace std;

/**
 * @brief 读取选项，选项不存在时读取环境变量，都不存在时返回 def
 */
template <typename T>
static T option_or_env(const boost::program_options::variables_map &vm, const string &option, const string &env, const T &def) {
    if (vm.count(option)) return vm.at(option).as<T>();
    if (getenv(env.c_str())) return boost::lexical_cast<T>(getenv(env.c_str()));
    return def;
}

static string default_address() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) return "localhost";
    return hostname;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // master 断开连接时不要因为 SIGPIPE 退出，沙箱中的子进程会恢复默认处理
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("dcx-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("master", po::value<string>(), "set the URL of master, default to http://127.0.0.1:8080. You can either pass it from environ MASTER_ADDR")
        ("worker-id", po::value<string>(), "set the id of this worker, default to a random UUID. You can either pass it from environ WORKER_ID")
        ("address", po::value<string>(), "set the address shown in /workers, default to the hostname. You can either pass it from environ WORKER_ADDRESS")
        ("capacity", po::value<int>(), "set how many test cases run concurrently, default to the number of cores. You can either pass it from environ CAPACITY")
        ("sandbox", po::value<string>(), "set the sandbox type, docker or process, default to docker. You can either pass it from environ SANDBOX")
        ("docker", po::value<string>(), "set the path of docker executable, default to docker. You can either pass it from environ DOCKER")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs, default to /tmp/dcx. You can either pass it from environ RUNDIR")
        ("cgroup-root", po::value<string>(), "set the parent cgroup for the process sandbox, relative to the cgroup mount point. You can either pass it from environ CGROUPROOT")
        ("isolate", "run user programs of the process sandbox in new network, IPC and UTS namespaces")
        ("languages", po::value<string>(), "load language profiles from the given JSON file, overriding the builtin ones. You can either pass it from environ LANGUAGES")
        ("report-retries", po::value<int>(), "set how many times a failed request to master is retried, default to 3. You can either pass it from environ REPORT_RETRIES")
        ("debug", "turn on the debug mode to keep the run directories of jobs")
        ("help", "display this help text");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "dcx-worker: fetch jobs from master, compile and run them in sandboxes" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        dcx::DEBUG = true;
    }

    if (vm.count("isolate") || getenv("ISOLATE")) {
        dcx::ISOLATE_NAMESPACES = true;
    }

    string master_addr, sandbox_type;
    int report_retries = 3;
    dcx::worker::agent_config agent_cfg;
    shared_ptr<const dcx::language::registry> languages;
    try {
        master_addr = option_or_env<string>(vm, "master", "MASTER_ADDR", "http://127.0.0.1:8080");
        agent_cfg.worker_id = option_or_env<string>(vm, "worker-id", "WORKER_ID", "");
        agent_cfg.address = option_or_env<string>(vm, "address", "WORKER_ADDRESS", default_address());
        agent_cfg.capacity = option_or_env<int>(vm, "capacity", "CAPACITY", (int)max(1u, thread::hardware_concurrency()));
        sandbox_type = option_or_env<string>(vm, "sandbox", "SANDBOX", "docker");
        dcx::DOCKER_BIN = option_or_env<string>(vm, "docker", "DOCKER", dcx::DOCKER_BIN);
        dcx::RUN_DIR = option_or_env<string>(vm, "run-dir", "RUNDIR", dcx::RUN_DIR.string());
        dcx::CGROUP_ROOT = option_or_env<string>(vm, "cgroup-root", "CGROUPROOT", "");
        report_retries = option_or_env<int>(vm, "report-retries", "REPORT_RETRIES", 3);

        string language_file = option_or_env<string>(vm, "languages", "LANGUAGES", "");
        languages = language_file.empty()
                        ? dcx::language::registry::builtin()
                        : dcx::language::registry::load(language_file);
    } catch (exception &e) {
        LOG(FATAL) << "Invalid configuration: " << boost::diagnostic_information(e);
    }

    CHECK(agent_cfg.capacity > 0) << "capacity should be positive";
    CHECK(report_retries >= 0) << "report-retries should not be negative";

    error_code ec;
    filesystem::create_directories(dcx::RUN_DIR, ec);
    CHECK(!ec) << "Unable to create run directory " << dcx::RUN_DIR << ": " << ec.message();

    unique_ptr<dcx::sandbox::sandbox> box;
    try {
        box = dcx::sandbox::make_sandbox(sandbox_type);
    } catch (exception &e) {
        LOG(FATAL) << "Unable to create sandbox " << sandbox_type << ": " << boost::diagnostic_information(e);
    }

    // 在创建任何线程之前屏蔽信号，由主线程同步等待
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    dcx::worker::curl_master_client client(master_addr, report_retries);
    dcx::worker::agent worker(client, *box, languages, agent_cfg);

    LOG(INFO) << "dcx-worker " << worker.id() << " connecting to " << master_addr
              << ", sandbox: " << box->type() << ", capacity: " << agent_cfg.capacity
              << ", languages: " << boost::algorithm::join(languages->languages(), ",");

    thread starter([&] { worker.start(); });

    int signum = 0;
    sigwait(&signals, &signum);
    LOG(INFO) << "Received signal " << signum << ", finishing running jobs";

    worker.stop();
    starter.join();
    LOG(INFO) << "dcx-worker stopped";
    return EXIT_SUCCESS;
}
