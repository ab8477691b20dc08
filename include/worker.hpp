#pragma once

#include <iosfwd>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "engine/execution.hpp"

/**
 * 批量执行服务相关函数
 * 主线程从 stdin 逐行读取请求，解析后推入 job 队列；
 * 每个 worker 线程从队列中取出请求执行，并把结果写成一行 JSON。
 * 响应的顺序与请求的顺序无关，调用方通过 id 对应请求与响应。
 *
 * 读到 EOF 或者收到 SIGINT/SIGTERM 后，主线程关闭队列，
 * worker 执行完队列中剩余的请求后退出。
 */
namespace runner {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 循环时会检查标记，
 * 如果停止，则不再等待新请求，而且在队列为空时退出。
 */
void stop_workers();

/**
 * @brief worker 是否已被要求停止
 */
bool workers_stopped();

/**
 * @brief 线程安全的响应输出，每次写入一行 JSON
 */
struct response_sink {
    explicit response_sink(std::ostream &os);

    void write(const nlohmann::json &response);

private:
    std::mutex mut;
    std::ostream &os;
};

/**
 * @brief 处理一个批量执行请求
 * 请求不合法时返回 {"id": ..., "error": "..."}，不会抛出异常
 * @param request {"id": ..., "type": "execute" | "check", ...}
 * @param exec 执行器
 * @return 响应，execute 请求返回 {"id", "type", "result"}，check 请求返回 {"id", "type", "report"}
 */
nlohmann::json handle_request(const nlohmann::json &request, const executor &exec);

/**
 * @brief 启动 worker 线程
 * @param worker_id worker 编号，用于日志
 * @param job_queue 读取线程发送请求的队列
 * @param exec 执行器，必须比 worker 线程活得更久
 * @param sink 响应输出
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<message::job> &job_queue, const executor &exec, response_sink &sink);

}  // namespace runner
