#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/checker.hpp"
#include "engine/execution.hpp"

/**
 * 这个头文件包含执行请求、执行结果、检验报告的 JSON 格式
 *
 * 执行结果的字段与 Judge0 的提交结果兼容：
 * {
 *   "stdout": "hello\n",
 *   "stderr": null,
 *   "compile_output": null,
 *   "status": "Accepted",
 *   "status_id": 3,
 *   "time": "0.012",
 *   "memory": 9012,
 *   "exit_code": 0
 * }
 * 不存在的字段输出为 null。
 */
namespace runner {

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @throw std::invalid_argument 缺少 source_code、language 或者字段类型不正确
 */
void from_json(const nlohmann::json &j, execution_request &request);

void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const test_case_result &result);

void to_json(nlohmann::json &j, const test_report &report);

/**
 * @brief 将用时格式化为保留 3 位小数的字符串
 */
std::string format_time(double seconds);

/**
 * @brief 将 json 序列化为单行文本
 * 程序输出可能不是合法的 UTF-8，非法字节会被替换为 U+FFFD 而不是抛出异常
 */
std::string dump_json(const nlohmann::json &j);

}  // namespace runner
