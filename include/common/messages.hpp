#pragma once

#include <string>
#include <nlohmann/json.hpp>

/**
 * 这个头文件包含批量执行模式中，读取线程发给 worker 的消息
 */
namespace runner::message {

/**
 * @brief 一行请求对应一个 job
 * 读取线程只负责切分行并解析 JSON，请求内容由 worker 解释
 */
struct job {
    /**
     * @brief 请求的行号，从 1 开始，用于日志
     */
    std::size_t line = 0;

    /**
     * @brief 解析后的请求
     * 形如 {"id": ..., "type": "execute" | "check", ...}
     */
    nlohmann::json request;
};

}  // namespace runner::message
