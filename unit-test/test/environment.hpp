#pragma once

#include <filesystem>
#include <string>

/**
 * 测试用的运行环境
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()，工作文件夹会被放在 /tmp/test/run
 * 2. 依赖编译器、解释器的测试用 has_tool 检查工具是否存在，不存在时 GTEST_SKIP
 */
namespace runner {

void setup_test_environment();

/**
 * @brief 在 PATH 中查找可执行文件
 */
bool has_tool(const std::string &name);

/**
 * @brief 在 dir 下创建一个可执行的 shell 脚本，用于模拟编译器
 * @return 脚本的绝对路径
 */
std::filesystem::path make_script(const std::filesystem::path &dir, const std::string &name, const std::string &body);

}  // namespace runner
