#include "engine/wire.hpp"
#include <fmt/core.h>
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

string format_time(double seconds) {
    return fmt::format("{:.3f}", seconds);
}

string dump_json(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void to_json(json &j, const execution_result &result) {
    j = {{"stdout", from_optional(result.stdout_text)},
         {"stderr", from_optional(result.stderr_text)},
         {"compile_output", from_optional(result.compile_output)},
         {"status", get_display_message(result.status)},
         {"status_id", get_status_id(result.status)},
         {"time", result.time ? json(format_time(*result.time)) : json(nullptr)},
         {"memory", from_optional(result.memory)},
         {"exit_code", from_optional(result.exitcode)}};
}

void from_json(const json &j, execution_request &request) {
    request.source_code = get_value<string>(j, "source_code");
    request.language = get_value<string>(j, "language");
    request.input = get_optional<string>(j, "stdin");
    request.time_limit = get_value_def<double>(j, -1, "time_limit");
}

void from_json(const json &j, test_case &tc) {
    tc.input = get_value_def<string>(j, "", "input");
    tc.expected_output = get_value_def<string>(j, "", "expected_output");
}

void to_json(json &j, const test_case_result &result) {
    j = {{"test_case", result.index},
         {"passed", result.passed},
         {"input", result.input},
         {"expected", result.expected},
         {"actual", result.actual},
         {"status", get_display_message(result.status)},
         {"time", result.time ? json(format_time(*result.time)) : json(nullptr)},
         {"error", from_optional(result.error)}};
}

void to_json(json &j, const test_report &report) {
    j = {{"passed", report.passed},
         {"total", report.total},
         {"all_passed", report.all_passed},
         {"results", report.results}};
}

}  // namespace runner
