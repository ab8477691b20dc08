#pragma once

#include <future>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "language.hpp"

/**
 * 这个头文件包含执行引擎
 * 包含：
 * 1. execution_request 类（表示一次执行请求）
 * 2. execution_result 类（表示一次执行的结果）
 * 3. executor 接口和其实现 execution_engine
 *
 * 一次执行的流程为：
 * 1. 根据语言标识符查找语言配置，不支持的语言直接返回 UNSUPPORTED
 * 2. 创建工作文件夹，写入源代码
 * 3. 如果语言需要编译，调用编译器（时间限制为 COMPILE_TIME_LIMIT）
 * 4. 运行程序，将 stdin 喂给程序（时间限制为请求的 time_limit）
 * 5. 删除工作文件夹
 */
namespace runner {

struct execution_request {
    /**
     * @brief 源代码
     * @note 长度不能超过 MAX_SOURCE_SIZE
     */
    std::string source_code;

    /**
     * @brief 编程语言标识符，比如 "python"、"cpp"
     */
    std::string language;

    /**
     * @brief 喂给程序的标准输入，为空时程序读到的 stdin 为空
     */
    std::optional<std::string> input;

    /**
     * @brief 运行阶段的时钟时间限制
     * 单位为秒，小于等于 0 时使用 DEFAULT_TIME_LIMIT
     */
    double time_limit = -1;
};

struct execution_result {
    /**
     * @brief 程序的标准输出，只有运行阶段执行了且有输出时才有值
     */
    std::optional<std::string> stdout_text;

    /**
     * @brief 程序的标准错误输出，对于 *_NOT_FOUND、超时、内部错误，保存错误说明
     */
    std::optional<std::string> stderr_text;

    /**
     * @brief 编译器的输出，只有编译失败或者编译器产生了警告信息时才有值
     */
    std::optional<std::string> compile_output;

    runner::status status = runner::status::INTERNAL_ERROR;

    /**
     * @brief 返回码
     * 编译错误时为编译器的返回码，否则为程序的返回码。
     * 程序没有启动或者超时被杀死时为空
     */
    std::optional<int> exitcode;

    /**
     * @brief 运行阶段用时，单位为秒
     */
    std::optional<double> time;

    /**
     * @brief 运行阶段的内存使用，单位为 KB
     */
    std::optional<long> memory;
};

/**
 * @brief 执行器接口
 * 实现必须是线程安全的，并且不能抛出异常：所有错误都要以评测结果的形式返回
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 编译并运行一份代码
     * @param request 执行请求
     * @return 执行结果，恰好包含一种评测结果
     */
    virtual execution_result execute(const execution_request &request) const = 0;
};

/**
 * @brief 在本机通过子进程编译、运行代码的执行器
 * 不同请求之间没有共享的可变状态，可以在多个线程中同时调用 execute
 */
struct execution_engine : public executor {
    /**
     * @param registry 语言注册表，必须比 execution_engine 活得更久
     */
    explicit execution_engine(const language_registry &registry);

    execution_result execute(const execution_request &request) const override;

    /**
     * @brief 在新线程中执行请求
     * @note 返回的 future 完成之前，execution_engine 不能被析构
     */
    std::future<execution_result> execute_async(execution_request request) const;

private:
    execution_result compile_and_run(const execution_request &request, const language_descriptor &desc) const;

    const language_registry &registry;
};

}  // namespace runner
