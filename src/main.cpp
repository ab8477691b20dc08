#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/io_utils.hpp"
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/checker.hpp"
#include "engine/execution.hpp"
#include "engine/wire.hpp"
#include "language.hpp"
#include "worker.hpp"
using namespace std;
namespace po = boost::program_options;

static void signal_handler(int /* signum */) {
    runner::stop_workers();
}

/**
 * @brief 命令行参数优先，其次是环境变量，都没有时保持默认值
 */
template <typename T>
static void load_option(const po::variables_map &vm, const string &option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (getenv(env)) {
        target = boost::lexical_cast<T>(get_env(env, ""));
    }
}

static void load_path_option(const po::variables_map &vm, const string &option, const char *env, filesystem::path &target) {
    if (vm.count(option)) {
        target = filesystem::path(vm.at(option).as<string>());
    } else if (getenv(env)) {
        target = filesystem::path(get_env(env, ""));
    }
}

static runner::execution_request load_request(const po::variables_map &vm) {
    runner::execution_request request;
    request.language = vm.at("language").as<string>();
    request.source_code = runner::read_file_content(vm.at("source").as<string>());
    if (vm.count("stdin"))
        request.input = runner::read_file_content(vm.at("stdin").as<string>());
    request.time_limit = runner::DEFAULT_TIME_LIMIT;
    return request;
}

static int run_once(const runner::execution_engine &engine, const po::variables_map &vm) {
    runner::execution_result result = engine.execute(load_request(vm));
    cout << runner::dump_json(result) << endl;
    return EXIT_SUCCESS;
}

static int check_once(const runner::execution_engine &engine, const po::variables_map &vm) {
    runner::execution_request request = load_request(vm);
    nlohmann::json tests = nlohmann::json::parse(runner::read_file_content(vm.at("tests").as<string>()));
    auto test_cases = tests.get<vector<runner::test_case>>();

    runner::test_report report = runner::check_solution(engine, request.source_code, request.language, test_cases,
                                                        request.time_limit, vm.at("parallel").as<size_t>());
    cout << runner::dump_json(report) << endl;
    return EXIT_SUCCESS;
}

static int serve(const runner::execution_engine &engine, size_t workers) {
    runner::concurrent_queue<runner::message::job> job_queue;
    runner::response_sink sink(cout);

    // worker 线程继承屏蔽字，保证 SIGINT/SIGTERM 只会打断主线程的读取
    sigset_t mask, old_mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, &old_mask);

    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(runner::start_worker(i, job_queue, engine, sink));

    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);

    // 不设置 SA_RESTART，使阻塞在 stdin 上的读取被信号打断
    struct sigaction action = {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    LOG(INFO) << "Serving requests with " << workers << " workers";

    string line;
    size_t line_no = 0;
    while (!runner::workers_stopped() && getline(cin, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        runner::message::job job;
        job.line = line_no;
        try {
            job.request = nlohmann::json::parse(line);
        } catch (nlohmann::json::exception &ex) {
            LOG(WARNING) << "Malformed request on line " << line_no << ": " << ex.what();
            sink.write({{"id", nullptr}, {"error", fmt::format("Malformed request on line {}: {}", line_no, ex.what())}});
            continue;
        }
        job_queue.push(move(job));
    }

    if (runner::workers_stopped())
        LOG(WARNING) << "Received signal, stopping workers";

    job_queue.close();
    for (auto &worker : worker_threads)
        worker.join();
    LOG(INFO) << "All workers stopped after " << line_no << " lines";
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("code-runner options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>(), "run: execute one source file; check: run a source file against test cases; serve: read JSON-lines requests from stdin")
        ("language", po::value<string>(), "language of the source file: c, cpp, java, javascript, python")
        ("source", po::value<string>(), "path of the source file")
        ("stdin", po::value<string>(), "path of the file fed to the program as stdin")
        ("tests", po::value<string>(), "path of the JSON array of test cases {input, expected_output} for check mode")
        ("parallel", po::value<size_t>()->default_value(1), "number of test cases evaluated concurrently in check mode")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNDIR")
        ("time-limit", po::value<double>(), "set the default run time limit in seconds, default to 5. You can either pass it from environ TIMELIMIT")
        ("compile-time-limit", po::value<double>(), "set the compile time limit in seconds, default to 30. You can either pass it from environ COMPILETIMELIMIT")
        ("max-source-size", po::value<size_t>(), "set the maximum source code size in bytes, default to 1048576. You can either pass it from environ MAXSOURCESIZE")
        ("output-limit", po::value<size_t>(), "set the maximum bytes kept for stdout and stderr, default to 16777216. You can either pass it from environ OUTPUTLIMIT")
        ("workers", po::value<size_t>(), "set the number of workers in serve mode, default to hardware concurrency. You can either pass it from environ WORKERS")
        ("python", po::value<string>(), "python interpreter. You can either pass it from environ PYTHON")
        ("node", po::value<string>(), "javascript runtime. You can either pass it from environ NODE")
        ("cc", po::value<string>(), "C compiler. You can either pass it from environ CC")
        ("cxx", po::value<string>(), "C++ compiler. You can either pass it from environ CXX")
        ("javac", po::value<string>(), "Java compiler. You can either pass it from environ JAVAC")
        ("java", po::value<string>(), "Java virtual machine. You can either pass it from environ JAVA")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("mode", 1);

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

    if (vm.count("help")) {
        cout << "CodeRunner: compile and run untrusted source code, compare its output with test cases" << endl
             << "Usage: " << argv[0] << " run --language L --source FILE [--stdin FILE]" << endl
             << "       " << argv[0] << " check --language L --source FILE --tests FILE [--parallel N]" << endl
             << "       " << argv[0] << " serve [--workers N]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    runner::toolchain tools;
    size_t workers = max(1u, thread::hardware_concurrency());
    try {
        load_path_option(vm, "run-dir", "RUNDIR", runner::RUN_DIR);
        load_option(vm, "time-limit", "TIMELIMIT", runner::DEFAULT_TIME_LIMIT);
        load_option(vm, "compile-time-limit", "COMPILETIMELIMIT", runner::COMPILE_TIME_LIMIT);
        load_option(vm, "max-source-size", "MAXSOURCESIZE", runner::MAX_SOURCE_SIZE);
        load_option(vm, "output-limit", "OUTPUTLIMIT", runner::OUTPUT_LIMIT);
        load_option(vm, "workers", "WORKERS", workers);
        load_option(vm, "python", "PYTHON", tools.python);
        load_option(vm, "node", "NODE", tools.node);
        load_option(vm, "cc", "CC", tools.cc);
        load_option(vm, "cxx", "CXX", tools.cxx);
        load_option(vm, "javac", "JAVAC", tools.javac);
        load_option(vm, "java", "JAVA", tools.java);
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Invalid environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(runner::DEFAULT_TIME_LIMIT > 0) << "Time limit should be positive";
    CHECK(runner::COMPILE_TIME_LIMIT > 0) << "Compile time limit should be positive";
    CHECK(workers > 0) << "At least one worker is required";

    // 编译、运行命令在工作文件夹中执行，命令中的路径必须是绝对路径
    runner::RUN_DIR = filesystem::absolute(runner::RUN_DIR);
    error_code ec;
    filesystem::create_directories(runner::RUN_DIR, ec);
    CHECK(filesystem::is_directory(runner::RUN_DIR))
        << "Run directory " << runner::RUN_DIR << " does not exist and cannot be created: " << ec.message();

    if (!vm.count("mode")) {
        cerr << "Mode is required: run, check or serve" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    runner::language_registry registry(tools);
    runner::execution_engine engine(registry);
    string mode = vm.at("mode").as<string>();

    if (mode == "run" || mode == "check") {
        if (vm.count("language") && !registry.find(vm.at("language").as<string>()))
            LOG(WARNING) << "Language " << vm.at("language").as<string>() << " is not one of " << boost::algorithm::join(registry.names(), ", ");
        for (const char *required : {"language", "source"}) {
            if (!vm.count(required)) {
                cerr << "--" << required << " is required in " << mode << " mode" << endl;
                return EXIT_FAILURE;
            }
        }
        if (mode == "check" && !vm.count("tests")) {
            cerr << "--tests is required in check mode" << endl;
            return EXIT_FAILURE;
        }
        for (const char *file : {"source", "stdin", "tests"}) {
            if (vm.count(file) && !filesystem::is_regular_file(vm.at(file).as<string>())) {
                cerr << "File " << vm.at(file).as<string>() << " does not exist" << endl;
                return EXIT_FAILURE;
            }
        }

        try {
            return mode == "run" ? run_once(engine, vm) : check_once(engine, vm);
        } catch (exception &ex) {
            LOG(ERROR) << "Unable to " << mode << " " << vm.at("source").as<string>() << ": " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            cerr << ex.what() << endl;
            return EXIT_FAILURE;
        }
    } else if (mode == "serve") {
        return serve(engine, workers);
    } else {
        cerr << "Unknown mode " << mode << ", supported modes: run, check, serve" << endl;
        return EXIT_FAILURE;
    }
}
