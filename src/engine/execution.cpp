#include "engine/execution.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstring>
#include <boost/algorithm/string/join.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "process.hpp"
#include "workspace.hpp"

namespace runner {
using namespace std;

executor::~executor() = default;

static optional<string> non_empty(string text) {
    if (text.empty()) return nullopt;
    return text;
}

static execution_result make_error(status status, const string &message) {
    execution_result result;
    result.status = status;
    result.stderr_text = message;
    return result;
}

execution_engine::execution_engine(const language_registry &registry)
    : registry(registry) {}

execution_result execution_engine::execute(const execution_request &request) const {
    const language_descriptor *desc = registry.find(request.language);
    if (!desc) {
        LOG(WARNING) << "Rejected request with unsupported language " << request.language;
        return make_error(status::UNSUPPORTED, "Unsupported language: " + request.language);
    }

    if (request.source_code.size() > MAX_SOURCE_SIZE) {
        LOG(WARNING) << "Rejected " << request.language << " source code of " << request.source_code.size() << " bytes";
        return make_error(status::INTERNAL_ERROR, fmt::format("Execution error: source code exceeds {} bytes", MAX_SOURCE_SIZE));
    }

    try {
        return compile_and_run(request, *desc);
    } catch (runner_exception &ex) {
        LOG(ERROR) << "Internal error while executing " << request.language << " code: " << ex;
        return make_error(status::INTERNAL_ERROR, fmt::format("Execution error: {}", ex.what()));
    } catch (exception &ex) {
        LOG(ERROR) << "Internal error while executing " << request.language << " code: " << ex.what() << endl
                   << boost::stacktrace::stacktrace();
        return make_error(status::INTERNAL_ERROR, fmt::format("Execution error: {}", ex.what()));
    }
}

future<execution_result> execution_engine::execute_async(execution_request request) const {
    return async(launch::async, [this, request = move(request)]() {
        return execute(request);
    });
}

execution_result execution_engine::compile_and_run(const execution_request &request, const language_descriptor &desc) const {
    const char *language_name = get_language_name(desc.id);
    execution_result result;

    // 离开作用域时删除工作文件夹
    workspace ws(RUN_DIR);
    ws.write_file(desc.source_file_name, request.source_code);
    LOG(INFO) << "Executing " << language_name << " code in " << ws.path();

    if (desc.compile_command) {
        process_options compile_opt;
        compile_opt.command = expand_command(*desc.compile_command, desc, ws.path());
        compile_opt.workdir = ws.path();
        compile_opt.time_limit = COMPILE_TIME_LIMIT;
        compile_opt.output_limit = OUTPUT_LIMIT;

        DLOG(INFO) << "Compiling " << language_name << " code: " << boost::algorithm::join(compile_opt.command, " ");
        process_result compile = run_process(compile_opt);

        if (compile.not_found) {
            const string &compiler = compile_opt.command.front();
            LOG(WARNING) << "Compiler " << compiler << " cannot be launched: " << strerror(compile.exec_errno);
            result.status = status::COMPILER_NOT_FOUND;
            result.stderr_text = fmt::format("{0} not found. Please install {0} to run {1} code locally.", compiler, language_name);
            return result;
        }

        if (compile.timed_out) {
            LOG(WARNING) << "Compilation of " << language_name << " code timed out in " << ws.path();
            result.status = status::TIME_LIMIT_EXCEEDED;
            result.stderr_text = fmt::format("Compilation timed out ({:g} second limit)", COMPILE_TIME_LIMIT);
            return result;
        }

        // gcc 和 javac 的诊断信息输出到 stderr，个别编译器输出到 stdout
        string diagnostics = compile.stderr_text.empty() ? compile.stdout_text : compile.stderr_text;
        if (compile.exitcode != 0) {
            result.status = status::COMPILATION_ERROR;
            result.compile_output = diagnostics.empty() ? "Compilation failed" : diagnostics;
            result.exitcode = compile.exitcode;
            return result;
        }
        result.compile_output = non_empty(move(diagnostics));
    }

    double time_limit = request.time_limit > 0 ? request.time_limit : DEFAULT_TIME_LIMIT;

    process_options run_opt;
    run_opt.command = expand_command(desc.run_command, desc, ws.path());
    run_opt.workdir = ws.path();
    run_opt.input = request.input.value_or("");
    run_opt.time_limit = time_limit;
    run_opt.output_limit = OUTPUT_LIMIT;

    DLOG(INFO) << "Running " << language_name << " code: " << boost::algorithm::join(run_opt.command, " ");
    process_result run = run_process(run_opt);

    if (run.not_found) {
        LOG(WARNING) << "Runtime " << run_opt.command.front() << " cannot be launched: " << strerror(run.exec_errno);
        result.status = status::RUNTIME_NOT_FOUND;
        result.stderr_text = fmt::format("{} not found. Please install it to run {} code locally.", run_opt.command.front(), language_name);
        return result;
    }

    result.stdout_text = non_empty(move(run.stdout_text));
    result.time = run.wall_time;
    if (run.memory >= 0) result.memory = run.memory;

    if (run.timed_out) {
        LOG(WARNING) << language_name << " program timed out after " << time_limit << "s in " << ws.path();
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.stderr_text = fmt::format("Execution timed out ({:g} second limit)", time_limit);
        return result;
    }

    result.stderr_text = non_empty(move(run.stderr_text));
    result.exitcode = run.exitcode;
    result.status = run.exitcode == 0 ? status::ACCEPTED : status::RUNTIME_ERROR;
    return result;
}

}  // namespace runner
