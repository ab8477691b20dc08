#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace runner {

struct runner_exception : std::exception {
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是工作文件夹无法创建、请求不合法等情况，
 * 会在 execution_engine::execute 中被转换为 INTERNAL_ERROR
 */
struct internal_error : public runner_exception {
    explicit internal_error(const std::string &message);
};

}  // namespace runner
