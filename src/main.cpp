#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "broker/redis_broker.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/sandbox.hpp"
#include "store/mysql_store.hpp"
#include "worker.hpp"
using namespace std;

static codejudge::dispatcher *running_dispatcher = nullptr;

void signal_handler(int /* signum */) {
    // 只设置停止标记，拉取循环在下一次迭代时退出，已经开始执行的任务会执行完成
    if (running_dispatcher) running_dispatcher->stop();
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge-worker options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ CODEJUDGE_CONFIG")
        ("worker-id", po::value<string>(), "set the worker id reported in heartbeats, default to worker-<8 random hex digits>")
        ("concurrency", po::value<size_t>(), "set the maximum number of submissions executed at the same time")
        ("sandbox", po::value<string>(), "set the path of the sandbox executable. You can either pass it from environ RUSTBOX")
        ("redis-host", po::value<string>(), "set the redis server address")
        ("redis-port", po::value<int>(), "set the redis server port")
        ("db-host", po::value<string>(), "set the MySQL server address")
        ("ensure-schema", "create the database tables if they do not exist")
        ("help", "display this help text")
        ("version", "display version of this application");
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
        cout << "codejudge-worker: Fetch submissions from the queue, execute them in the sandbox" << endl
             << "Optional Environment Variables:" << endl
             << "\tCODEJUDGE_CONFIG: location of the configuration file" << endl
             << "\tRUSTBOX: location of the sandbox executable" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge-worker 1.0" << endl;
        return EXIT_SUCCESS;
    }

    codejudge::system_config config;
    try {
        string config_path = vm.count("config") ? vm.at("config").as<string>() : codejudge::get_env("CODEJUDGE_CONFIG", "");
        if (!config_path.empty()) {
            config = codejudge::load_config(config_path);
            LOG(INFO) << "Loaded configuration from " << config_path;
        } else {
            LOG(WARNING) << "No configuration file given, using default configuration";
        }
    } catch (std::exception &ex) {
        cerr << "Unable to load configuration: " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("concurrency")) config.worker.concurrency = vm.at("concurrency").as<size_t>();
    if (vm.count("sandbox"))
        config.sandbox.binary = vm.at("sandbox").as<string>();
    else if (getenv("RUSTBOX"))
        config.sandbox.binary = getenv("RUSTBOX");
    if (vm.count("redis-host")) config.redis.host = vm.at("redis-host").as<string>();
    if (vm.count("redis-port")) config.redis.port = vm.at("redis-port").as<int>();
    if (vm.count("db-host")) config.database.host = vm.at("db-host").as<string>();

    CHECK(config.worker.concurrency > 0) << "Concurrency should be positive";

    string worker_id = vm.count("worker-id") ? vm.at("worker-id").as<string>() : codejudge::make_worker_id();

    try {
        codejudge::broker::redis_broker queue(config.redis, config.limits, config.worker);
        CHECK(queue.ping()) << "Unable to connect to redis server " << config.redis.host << ":" << config.redis.port;

        codejudge::store::mysql_store store(config.database);
        CHECK(store.ping()) << "Unable to connect to MySQL server " << config.database.host << ":" << config.database.port;
        if (vm.count("ensure-schema")) store.ensure_schema();

        codejudge::sandbox::sandbox_adapter adapter(config.sandbox);
        if (!adapter.is_available())
            LOG(WARNING) << "Sandbox " << config.sandbox.binary << " is not available, submissions will fail until it is fixed";

        codejudge::dispatcher worker(worker_id, queue, adapter, store, config.worker);
        running_dispatcher = &worker;
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        worker.run();

        running_dispatcher = nullptr;
    } catch (codejudge::codejudge_exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed: " << ex.what() << endl
                   << ex;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " failed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
