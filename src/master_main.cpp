#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/utils.hpp"
#include "config.hpp"
#include "master/http_api.hpp"
#include "master/job_store.hpp"
#include "master/scheduler.hpp"
#include "master/service.hpp"
#include "master/worker_registry.hpp"
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

/**
 * @brief 将 host:port 拆分为 host 和 port
 */
static pair<string, int> parse_listen_address(const string &listen) {
    auto colon = listen.rfind(':');
    if (colon == string::npos)
        throw invalid_argument("listen address should be host:port, got " + listen);
    return {listen.substr(0, colon), boost::lexical_cast<int>(listen.substr(colon + 1))};
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 客户端断开连接时不要因为 SIGPIPE 退出
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("dcx-master options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("listen", po::value<string>(), "set the address the HTTP server listens on, default to 0.0.0.0:8080. You can either pass it from environ LISTEN")
        ("languages", po::value<string>(), "load language profiles from the given JSON file, overriding the builtin ones. You can either pass it from environ LANGUAGES")
        ("ack-timeout", po::value<int>(), "set milliseconds a worker has to acknowledge an assignment, default to 5000. You can either pass it from environ ACK_TIMEOUT")
        ("heartbeat-timeout", po::value<int>(), "set milliseconds without heartbeat before a worker is evicted, default to 10000. You can either pass it from environ HEARTBEAT_TIMEOUT")
        ("max-attempts", po::value<int>(), "set how many times a job is dispatched before it fails, default to 3. You can either pass it from environ MAX_ATTEMPTS")
        ("job-retention", po::value<int>(), "set seconds a finished job is kept, default to 3600. You can either pass it from environ JOB_RETENTION")
        ("max-test-cases", po::value<size_t>(), "set the maximum number of test cases in a submission, default to 256. You can either pass it from environ MAX_TEST_CASES")
        ("debug", "turn on the debug mode to log more details")
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
        cout << "dcx-master: accept submissions, dispatch them to workers and collect verdicts" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        dcx::DEBUG = true;
    }

    string listen;
    dcx::master::scheduler_config sched_cfg;
    dcx::master::service_config service_cfg;
    shared_ptr<const dcx::language::registry> languages;
    try {
        listen = option_or_env<string>(vm, "listen", "LISTEN", "0.0.0.0:8080");
        sched_cfg.ack_timeout = chrono::milliseconds(option_or_env<int>(vm, "ack-timeout", "ACK_TIMEOUT", 5000));
        sched_cfg.heartbeat_timeout = chrono::milliseconds(option_or_env<int>(vm, "heartbeat-timeout", "HEARTBEAT_TIMEOUT", 10000));
        sched_cfg.max_attempts = option_or_env<int>(vm, "max-attempts", "MAX_ATTEMPTS", 3);
        sched_cfg.job_retention = chrono::seconds(option_or_env<int>(vm, "job-retention", "JOB_RETENTION", 3600));
        service_cfg.max_test_cases = option_or_env<size_t>(vm, "max-test-cases", "MAX_TEST_CASES", 256);

        string language_file = option_or_env<string>(vm, "languages", "LANGUAGES", "");
        languages = language_file.empty()
                        ? dcx::language::registry::builtin()
                        : dcx::language::registry::load(language_file);
    } catch (exception &e) {
        LOG(FATAL) << "Invalid configuration: " << boost::diagnostic_information(e);
    }

    CHECK(sched_cfg.max_attempts >= 1) << "max-attempts should be at least 1";
    CHECK(sched_cfg.ack_timeout.count() > 0) << "ack-timeout should be positive";
    CHECK(sched_cfg.heartbeat_timeout.count() > 0) << "heartbeat-timeout should be positive";
    CHECK(service_cfg.max_test_cases > 0) << "max-test-cases should be positive";

    pair<string, int> address;
    try {
        address = parse_listen_address(listen);
    } catch (exception &e) {
        LOG(FATAL) << "Invalid listen address " << listen << ": " << e.what();
    }

    // 信号由专门的线程同步等待，这样可以安全地停止 HTTP 服务器
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    dcx::master::job_store store;
    dcx::master::worker_registry registry;
    dcx::master::scheduler sched(store, registry, sched_cfg);
    dcx::master::service svc(languages, store, registry, sched, service_cfg);
    dcx::master::http_api api(svc);

    httplib::Server server;
    api.bind(server);

    thread signal_thread([&] {
        int signum = 0;
        sigwait(&signals, &signum);
        LOG(INFO) << "Received signal " << signum << ", stopping master";
        server.stop();
    });
    signal_thread.detach();

    sched.start();
    LOG(INFO) << "dcx-master listening on " << address.first << ":" << address.second
              << ", languages: " << boost::algorithm::join(languages->languages(), ",");

    if (!server.listen(address.first.c_str(), address.second)) {
        LOG(ERROR) << "Unable to listen on " << listen;
        sched.stop();
        return EXIT_FAILURE;
    }

    sched.stop();
    LOG(INFO) << "dcx-master stopped";
    return EXIT_SUCCESS;
}
