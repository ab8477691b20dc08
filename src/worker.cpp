#include "worker.hpp"
#include <glog/logging.h>
#include <atomic>
#include <ostream>
#include <boost/exception/diagnostic_information.hpp>
#include "common/json_utils.hpp"
#include "engine/checker.hpp"
#include "engine/wire.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

response_sink::response_sink(ostream &os) : os(os) {}

void response_sink::write(const json &response) {
    string line = dump_json(response);
    lock_guard<mutex> guard(mut);
    os << line << '\n';
    os.flush();
}

static json error_response(const json &id, const string &message) {
    return {{"id", id}, {"error", message}};
}

json handle_request(const json &request, const executor &exec) {
    json id = exists(request, "id") ? request.at("id") : json(nullptr);
    try {
        if (!request.is_object())
            return error_response(id, "Request must be a JSON object");

        string type = get_value_def<string>(request, "execute", "type");
        if (type == "execute") {
            execution_request req = request.get<execution_request>();
            execution_result result = exec.execute(req);
            return {{"id", id}, {"type", type}, {"result", result}};
        } else if (type == "check") {
            execution_request req = request.get<execution_request>();
            vector<test_case> test_cases = get_value<vector<test_case>>(request, "test_cases");
            size_t parallelism = get_value_def<size_t>(request, 1, "parallel");
            test_report report = check_solution(exec, req.source_code, req.language, test_cases, req.time_limit, parallelism);
            return {{"id", id}, {"type", type}, {"report", report}};
        } else {
            return error_response(id, "Unknown request type: " + type);
        }
    } catch (exception &ex) {
        LOG(WARNING) << "Malformed request " << id << ": " << ex.what();
        return error_response(id, ex.what());
    }
}

static void worker_loop(size_t worker_id, concurrent_queue<message::job> &job_queue, const executor &exec, response_sink &sink) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        message::job job;
        if (stop) {
            // 停止后不再等待新请求，队列中剩余的请求执行完后退出
            if (!job_queue.try_pop(job)) break;
        } else if (!job_queue.pop(job)) {
            break;
        }

        DLOG(INFO) << "Worker " << worker_id << " handling request on line " << job.line;
        try {
            sink.write(handle_request(job.request, exec));
        } catch (exception &ex) {
            // 一般是输出流出错，记录后继续处理下一个请求
            LOG(ERROR) << "Worker " << worker_id << " failed to handle request on line " << job.line << ": " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<message::job> &job_queue, const executor &exec, response_sink &sink) {
    return thread([worker_id, &job_queue, &exec, &sink] {
        worker_loop(worker_id, job_queue, exec, sink);
    });
}

}  // namespace runner
