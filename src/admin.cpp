#include <glog/logging.h>
#include <signal.h>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>
#include <iostream>
#include <thread>
#include "broker/redis_broker.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/submission_service.hpp"
#include "sandbox/sandbox.hpp"
#include "store/mysql_store.hpp"
using namespace std;
using namespace nlohmann;
using namespace codejudge;
namespace po = boost::program_options;

static atomic<bool> interrupted{false};

void signal_handler(int /* signum */) {
    interrupted = true;
}

static void print_json(const json &j) {
    cout << j.dump(2) << endl;
}

/**
 * @brief 根据命令行参数构造提交请求，源代码从文件中读取
 */
static new_submission make_request(const po::variables_map &vm, const string &source_path) {
    new_submission request;
    request.source_code = read_file_content(source_path);
    request.language_id = vm.at("language").as<int>();
    if (vm.count("stdin")) request.stdin_text = read_file_content(vm.at("stdin").as<string>());
    if (vm.count("expected")) request.expected_output = read_file_content(vm.at("expected").as<string>());
    if (vm.count("time")) request.time_limit = vm.at("time").as<int>();
    if (vm.count("memory")) request.memory_limit = vm.at("memory").as<int>();
    return request;
}

static int command_stats(broker::broker &job_queue, store::submission_store &submissions) {
    json partitions = json::object();
    for (int priority = job_queue.max_priority(); priority >= 0; --priority)
        partitions[to_string(priority)] = job_queue.queue_depth(priority);

    json counts = json::object();
    for (auto &[stat, count] : submissions.count_by_status())
        counts[get_display_message(stat)] = count;

    print_json({{"total_depth", job_queue.total_depth()},
                {"partitions", partitions},
                {"live_workers", job_queue.live_worker_count()},
                {"workers", job_queue.list_workers()},
                {"submissions", counts}});
    return EXIT_SUCCESS;
}

static int command_languages() {
    json table = json::array();
    for (auto &lang : languages()) {
        json entry = {{"id", lang.id},
                      {"name", lang.name},
                      {"version", lang.version},
                      {"extension", lang.extension},
                      {"run_command", lang.run_command}};
        entry["compile_command"] = lang.compile_command ? json(*lang.compile_command) : json(nullptr);
        table.push_back(entry);
    }
    print_json(table);
    return EXIT_SUCCESS;
}

static int command_events(broker::broker &job_queue) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    mutex print_mut;
    auto sub = job_queue.subscribe([&](const broker::event &e) {
        lock_guard<mutex> guard(print_mut);
        cout << json(e).dump() << endl;
    });
    LOG(INFO) << "Listening for events, press Ctrl-C to stop";
    while (!interrupted)
        this_thread::sleep_for(chrono::milliseconds(200));
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("codejudge-admin options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "stats, clear-queues, submit, execute, edit, show, languages, self-test or events")
        ("args", po::value<vector<string>>()->default_value({}, ""), "arguments of the command")
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ CODEJUDGE_CONFIG")
        ("sandbox", po::value<string>(), "set the path of the sandbox executable. You can either pass it from environ RUSTBOX")
        ("redis-host", po::value<string>(), "set the redis server address")
        ("db-host", po::value<string>(), "set the MySQL server address")
        ("ensure-schema", "create the database tables if they do not exist before running the command")
        ("language", po::value<int>()->default_value(1), "language id of the submitted source code")
        ("priority", po::value<int>()->default_value(0), "queue priority of the submission, larger is more urgent")
        ("stdin", po::value<string>(), "file whose content is passed as the standard input")
        ("expected", po::value<string>(), "file whose content is the expected output")
        ("time", po::value<int>(), "time limit in seconds")
        ("memory", po::value<int>(), "memory limit in MB")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1).add("args", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "codejudge-admin: Operational tooling of the codejudge pipeline" << endl
             << "Usage: " << argv[0] << " <command> [args] [options]" << endl
             << "\tstats                  queue depths, live workers and submission counts" << endl
             << "\tclear-queues           drop every waiting job" << endl
             << "\tsubmit <source>        create a submission and put it into the queue" << endl
             << "\texecute <source>       create a submission and execute it immediately" << endl
             << "\tedit <id>              change stdin, expected output or limits of a queued submission" << endl
             << "\tshow <id>              print a submission" << endl
             << "\tlanguages              print the supported languages" << endl
             << "\tself-test              check the sandbox" << endl
             << "\tevents                 print pipeline events until interrupted" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "codejudge-admin 1.0" << endl;
        return EXIT_SUCCESS;
    }

    system_config config;
    try {
        string config_path = vm.count("config") ? vm.at("config").as<string>() : get_env("CODEJUDGE_CONFIG", "");
        if (!config_path.empty()) config = load_config(config_path);
    } catch (std::exception &ex) {
        cerr << "Unable to load configuration: " << ex.what() << endl;
        return EXIT_FAILURE;
    }
    if (vm.count("sandbox"))
        config.sandbox.binary = vm.at("sandbox").as<string>();
    else if (getenv("RUSTBOX"))
        config.sandbox.binary = getenv("RUSTBOX");
    if (vm.count("redis-host")) config.redis.host = vm.at("redis-host").as<string>();
    if (vm.count("db-host")) config.database.host = vm.at("db-host").as<string>();

    string command = vm.at("command").as<string>();
    auto args = vm.at("args").as<vector<string>>();
    auto require_args = [&](size_t count) {
        if (args.size() < count)
            BOOST_THROW_EXCEPTION(validation_error("Command " + command + " requires " + to_string(count) + " argument(s)"));
    };

    try {
        if (command == "languages") {
            return command_languages();
        } else if (command == "self-test") {
            sandbox::sandbox_adapter adapter(config.sandbox);
            auto result = adapter.self_test();
            print_json({{"info", adapter.info()}, {"self_test", result}});
            return result.test_passed ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        broker::redis_broker job_queue(config.redis, config.limits, config.worker);

        if (command == "clear-queues") {
            size_t cleared = job_queue.clear_all();
            LOG(WARNING) << "Cleared " << cleared << " jobs from all queues";
            print_json({{"cleared", cleared}});
            return EXIT_SUCCESS;
        } else if (command == "events") {
            return command_events(job_queue);
        }

        store::mysql_store submissions(config.database);
        if (vm.count("ensure-schema")) submissions.ensure_schema();

        if (command == "stats") {
            return command_stats(job_queue, submissions);
        } else if (command == "show") {
            require_args(1);
            long long submission_id = boost::lexical_cast<long long>(args[0]);
            auto submit = submissions.find(submission_id);
            if (!submit) BOOST_THROW_EXCEPTION(submission_not_found(submission_id));
            print_json(*submit);
            return EXIT_SUCCESS;
        }

        sandbox::sandbox_adapter adapter(config.sandbox);
        submission_service service(job_queue, adapter, submissions, config.limits);

        if (command == "submit") {
            require_args(1);
            vector<new_submission> requests;
            for (auto &path : args) requests.push_back(make_request(vm, path));
            json created = json::array();
            for (auto &item : service.create_batch(requests, vm.at("priority").as<int>()))
                created.push_back({{"submission_id", item.record.id}, {"job_id", item.job_id}});
            print_json(created);
            return EXIT_SUCCESS;
        } else if (command == "execute") {
            require_args(1);
            submission finished = service.execute_now(make_request(vm, args[0]));
            print_json(finished);
            return finished.status == status::INTERNAL_ERROR ? EXIT_FAILURE : EXIT_SUCCESS;
        } else if (command == "edit") {
            require_args(1);
            long long submission_id = boost::lexical_cast<long long>(args[0]);
            submission_edit edit;
            if (vm.count("stdin")) edit.stdin_text = read_file_content(vm.at("stdin").as<string>());
            if (vm.count("expected")) edit.expected_output = read_file_content(vm.at("expected").as<string>());
            if (vm.count("time")) edit.time_limit = vm.at("time").as<int>();
            if (vm.count("memory")) edit.memory_limit = vm.at("memory").as<int>();
            if (!service.update_submission(submission_id, edit)) {
                cerr << "Submission " << submission_id << " is no longer queued" << endl;
                return EXIT_FAILURE;
            }
            print_json(*service.find(submission_id));
            return EXIT_SUCCESS;
        }

        cerr << "Unknown command " << command << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (validation_error &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast &) {
        cerr << "Submission id should be an integer" << endl;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Command " << command << " failed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
