#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "engine/execution.hpp"

namespace runner {

struct test_case {
    /**
     * @brief 喂给程序的标准输入
     */
    std::string input;

    /**
     * @brief 期望的标准输出
     */
    std::string expected_output;
};

struct test_case_result {
    /**
     * @brief 测试点编号，从 1 开始
     */
    std::size_t index = 0;

    bool passed = false;

    std::string input;

    /**
     * @brief 去掉首尾空白后的期望输出
     */
    std::string expected;

    /**
     * @brief 去掉首尾空白后的实际输出，程序没有输出时为空串
     */
    std::string actual;

    runner::status status = runner::status::INTERNAL_ERROR;

    std::optional<double> time;

    /**
     * @brief 程序的 stderr，没有时为编译器输出
     */
    std::optional<std::string> error;
};

struct test_report {
    std::size_t passed = 0;
    std::size_t total = 0;
    bool all_passed = true;

    /**
     * @brief 各测试点的结果，顺序与输入的测试点顺序一致
     */
    std::vector<test_case_result> results;
};

/**
 * @brief 比较程序输出与期望输出
 * 只忽略首尾的空白字符，中间的空白、大小写均需完全一致
 */
bool outputs_match(const std::string &expected, const std::string &actual);

/**
 * @brief 用一组测试点检验一份代码
 * 每个测试点单独执行一次，即使前面的测试点失败也会继续执行。
 * 测试点通过当且仅当评测结果为 ACCEPTED 且 outputs_match 为真。
 *
 * @param exec 执行器，parallelism > 1 时会在多个线程中同时调用
 * @param source_code 源代码
 * @param language 编程语言标识符
 * @param test_cases 测试点
 * @param time_limit 每个测试点的时间限制，单位为秒
 * @param parallelism 同时执行的测试点数量
 */
test_report check_solution(const executor &exec,
                           const std::string &source_code,
                           const std::string &language,
                           const std::vector<test_case> &test_cases,
                           double time_limit,
                           std::size_t parallelism = 1);

}  // namespace runner
