#include "engine/checker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include <boost/algorithm/string/trim.hpp>
#include "common/concurrent_queue.hpp"

namespace runner {
using namespace std;

bool outputs_match(const string &expected, const string &actual) {
    return boost::algorithm::trim_copy(expected) == boost::algorithm::trim_copy(actual);
}

static test_case_result check_test_case(const executor &exec, const execution_request &base, const test_case &tc, size_t index) {
    test_case_result result;
    result.index = index + 1;
    result.input = tc.input;
    result.expected = boost::algorithm::trim_copy(tc.expected_output);

    execution_request request = base;
    request.input = tc.input;

    execution_result execution;
    try {
        execution = exec.execute(request);
    } catch (exception &ex) {
        LOG(ERROR) << "Executor failed on test case " << result.index << ": " << ex.what();
        execution.status = status::INTERNAL_ERROR;
        execution.stderr_text = string("Execution error: ") + ex.what();
    }

    result.status = execution.status;
    result.time = execution.time;
    result.actual = boost::algorithm::trim_copy(execution.stdout_text.value_or(""));
    result.passed = execution.status == status::ACCEPTED && result.expected == result.actual;
    result.error = execution.stderr_text ? execution.stderr_text : execution.compile_output;
    return result;
}

test_report check_solution(const executor &exec,
                           const string &source_code,
                           const string &language,
                           const vector<test_case> &test_cases,
                           double time_limit,
                           size_t parallelism) {
    execution_request base;
    base.source_code = source_code;
    base.language = language;
    base.time_limit = time_limit;

    test_report report;
    report.total = test_cases.size();
    report.results.resize(test_cases.size());

    size_t threads = min(max<size_t>(parallelism, 1), test_cases.size());
    if (threads <= 1) {
        for (size_t i = 0; i < test_cases.size(); ++i)
            report.results[i] = check_test_case(exec, base, test_cases[i], i);
    } else {
        concurrent_queue<size_t> indices;
        for (size_t i = 0; i < test_cases.size(); ++i)
            indices.push(i);
        indices.close();

        // 每个线程只写自己取到的下标，results 已经预先分配好
        vector<thread> workers;
        for (size_t t = 0; t < threads; ++t) {
            workers.emplace_back([&]() {
                size_t i;
                while (indices.pop(i))
                    report.results[i] = check_test_case(exec, base, test_cases[i], i);
            });
        }
        for (auto &worker : workers) worker.join();
    }

    for (auto &result : report.results)
        if (result.passed) ++report.passed;
    report.all_passed = report.passed == report.total;

    LOG(INFO) << "Checked " << language << " solution: " << report.passed << "/" << report.total << " test cases passed";
    return report;
}

}  // namespace runner
