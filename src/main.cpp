#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/docker.hpp"
#include "sandbox/availability.hpp"
#include "sandbox/cache.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/image.hpp"
#include "sandbox/orchestrator.hpp"
#include "sandbox/reaper.hpp"
using namespace std;

/**
 * @brief 一个待执行的请求，id 用于在输出中对应请求
 */
struct pending_request {
    nlohmann::json id;
    nlohmann::json body;
};

/**
 * @brief 执行一个请求并输出一行 JSON
 */
static void process_request(sandbox::code_executor &executor, const pending_request &task, bool graded, mutex &output_mutex) {
    nlohmann::json output;
    try {
        auto request = sandbox::parse_request(task.body, graded);
        if (request.graded()) {
            output = executor.grade(request);
        } else {
            output = executor.execute(request);
        }
    } catch (invalid_argument &e) {
        output = {{"success", false}, {"error", string("Invalid request: ") + e.what()}};
    } catch (nlohmann::json::exception &e) {
        output = {{"success", false}, {"error", string("Invalid request: ") + e.what()}};
    }
    output["id"] = task.id;

    lock_guard<mutex> guard(output_mutex);
    cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("code-sandbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load sandbox configuration from the given JSON file. You can either pass it from environ SANDBOX_CONFIG")
        ("engine", po::value<string>(), "set the container engine client, default to docker. You can either pass it from environ SANDBOX_ENGINE")
        ("image", po::value<string>(), "set the name of the execution image. You can either pass it from environ SANDBOX_IMAGE")
        ("image-context", po::value<string>(), "set the directory containing the Dockerfile of the execution image. You can either pass it from environ SANDBOX_IMAGE_CONTEXT")
        ("state-dir", po::value<string>(), "set the directory to store the image build lock. You can either pass it from environ SANDBOX_STATE_DIR")
        ("request", po::value<vector<string>>(), "execute the request stored in the given JSON file, can be repeated")
        ("stdin", "read requests from standard input, one JSON document per line")
        ("workers", po::value<unsigned>()->default_value(1), "set the number of requests executed concurrently")
        ("graded", "grade all requests, bypassing the cache")
        ("no-cache", "disable the result cache")
        ("probe", "check whether the container engine is reachable and exit")
        ("status", "print diagnostics of the container engine and exit")
        ("reap", "remove stale sandbox containers and exit")
        ("reap-interval", po::value<unsigned>(), "remove stale sandbox containers every given seconds while executing requests")
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
        cout << "CodeSandbox: execute untrusted code in single-use containers" << endl
             << "Requests are JSON documents: {code, language?, test_cases?, time_limit?, memory_limit?, use_cache?, graded?}" << endl
             << "Results are printed as one JSON document per line" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-sandbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    sandbox::sandbox_config config;
    config.image_context = repo_dir / "exec" / "python-executor";

    string config_file = vm.count("config") ? vm.at("config").as<string>() : sandbox::get_env("SANDBOX_CONFIG", "");
    if (!config_file.empty()) {
        CHECK(filesystem::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            nlohmann::json j = nlohmann::json::parse(sandbox::read_file_content(config_file));
            config = j.get<sandbox::sandbox_config>();
            if (!sandbox::exists(j, "image", "context"))
                config.image_context = repo_dir / "exec" / "python-executor";
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
        }
    }

    // 命令行参数优先于环境变量，环境变量优先于配置文件
    config.engine_binary = vm.count("engine") ? vm.at("engine").as<string>()
                                              : sandbox::get_env("SANDBOX_ENGINE", config.engine_binary);
    config.image_name = vm.count("image") ? vm.at("image").as<string>()
                                          : sandbox::get_env("SANDBOX_IMAGE", config.image_name);
    config.image_context = vm.count("image-context") ? vm.at("image-context").as<string>()
                                                     : sandbox::get_env("SANDBOX_IMAGE_CONTEXT", config.image_context.string());
    config.state_dir = vm.count("state-dir") ? vm.at("state-dir").as<string>()
                                             : sandbox::get_env("SANDBOX_STATE_DIR", config.state_dir.string());

    sandbox::engine::system_command_runner runner;
    sandbox::engine::docker_engine engine(runner, config.engine_binary);
    sandbox::availability_gate gate(engine, config.probe_timeout);

    if (vm.count("probe")) {
        auto reason = gate.probe();
        nlohmann::json output = {{"available", !reason}};
        if (reason) output["error"] = *reason;
        cout << output.dump() << endl;
        return reason ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (vm.count("status")) {
        nlohmann::json output = gate.status();
        cout << output.dump() << endl;
        return EXIT_SUCCESS;
    }

    sandbox::stale_sandbox_reaper reaper(engine, config.reap_max_age);
    if (vm.count("reap")) {
        try {
            size_t removed = reaper.sweep();
            cout << nlohmann::json({{"removed", removed}}).dump() << endl;
            return EXIT_SUCCESS;
        } catch (sandbox::sandbox_exception &e) {
            LOG(ERROR) << "Unable to remove stale containers: " << e;
            return EXIT_FAILURE;
        }
    }

    CHECK(vm.count("request") || vm.count("stdin"))
        << "No requests given. Pass --request FILE or --stdin, see --help";

    sandbox::execution_cache cache(config.cache_ttl, config.cache_capacity);
    sandbox::image_provisioner images(engine, config.image_name, config.image_context, config.state_dir, config.build_timeout);
    sandbox::sandbox_orchestrator orchestrator(engine, images, config);
    sandbox::code_executor executor(gate, orchestrator, cache, config);

    if (vm.count("reap-interval"))
        reaper.start(chrono::seconds(vm["reap-interval"].as<unsigned>()));

    bool graded = vm.count("graded") > 0;
    bool no_cache = vm.count("no-cache") > 0;
    sandbox::concurrent_queue<pending_request> requests;
    mutex output_mutex;

    unsigned worker_count = max(1u, vm["workers"].as<unsigned>());
    vector<thread> worker_threads;
    for (unsigned i = 0; i < worker_count; ++i) {
        worker_threads.emplace_back([&] {
            pending_request task;
            while (requests.pop(task))
                process_request(executor, task, graded, output_mutex);
        });
    }

    size_t index = 0;
    auto enqueue = [&](nlohmann::json body, const nlohmann::json &fallback_id) {
        if (no_cache && body.is_object()) body["use_cache"] = false;
        nlohmann::json id = body.is_object() && body.contains("id") ? body.at("id") : fallback_id;
        requests.push({id, move(body)});
        ++index;
    };

    if (vm.count("request")) {
        for (auto &file : vm.at("request").as<vector<string>>()) {
            try {
                enqueue(nlohmann::json::parse(sandbox::read_file_content(file)), file);
            } catch (std::exception &e) {
                LOG(ERROR) << "Unable to read request " << file << ": " << e.what();
                lock_guard<mutex> guard(output_mutex);
                cout << nlohmann::json({{"id", file}, {"success", false}, {"error", string("Invalid request: ") + e.what()}}).dump() << endl;
            }
        }
    }

    if (vm.count("stdin")) {
        string line;
        while (getline(cin, line)) {
            if (line.find_first_not_of(" \t\r") == string::npos) continue;
            try {
                enqueue(nlohmann::json::parse(line), index);
            } catch (nlohmann::json::exception &e) {
                lock_guard<mutex> guard(output_mutex);
                cout << nlohmann::json({{"id", index++}, {"success", false}, {"error", string("Invalid request: ") + e.what()}}).dump() << endl;
            }
        }
    }

    requests.close();
    for (auto &th : worker_threads)
        th.join();

    reaper.stop();
    return EXIT_SUCCESS;
}
