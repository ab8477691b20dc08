#pragma once

#include "engine/execution.hpp"
#include "gmock/gmock.h"

namespace runner {

/**
 * @brief 用于测试 check_solution 的执行器，不会真正运行代码
 */
class mock_executor : public executor {
public:
    MOCK_METHOD(execution_result, execute, (const execution_request &request), (const, override));
};

/**
 * @brief 构造一个正常结束的执行结果
 */
inline execution_result accepted_with(const std::string &stdout_text) {
    execution_result result;
    result.status = status::ACCEPTED;
    result.stdout_text = stdout_text;
    result.exitcode = 0;
    result.time = 0.01;
    return result;
}

}  // namespace runner
