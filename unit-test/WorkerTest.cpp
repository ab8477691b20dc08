#include "worker.hpp"
#include <sstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_executor.hpp"

using namespace std;
using namespace runner;
using nlohmann::json;
using ::testing::_;
using ::testing::Return;

TEST(WorkerTest, HandleExecuteRequest) {
    mock_executor exec;
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(accepted_with("hi\n")));

    json response = handle_request(json::parse(R"json({"id": 7, "type": "execute", "source_code": "print('hi')", "language": "python"})json"), exec);
    EXPECT_EQ(response["id"], 7);
    EXPECT_EQ(response["type"], "execute");
    EXPECT_EQ(response["result"]["status"], "Accepted");
    EXPECT_EQ(response["result"]["stdout"], "hi\n");
}

TEST(WorkerTest, HandleCheckRequest) {
    mock_executor exec;
    EXPECT_CALL(exec, execute(_))
        .WillOnce(Return(accepted_with("2\n")))
        .WillOnce(Return(accepted_with("5\n")));

    json response = handle_request(json::parse(R"({
        "id": "job-1", "type": "check", "source_code": "...", "language": "python",
        "test_cases": [{"input": "1", "expected_output": "2"}, {"input": "2", "expected_output": "4"}]
    })"),
                                   exec);
    EXPECT_EQ(response["id"], "job-1");
    EXPECT_EQ(response["report"]["passed"], 1);
    EXPECT_EQ(response["report"]["total"], 2);
    EXPECT_EQ(response["report"]["all_passed"], false);
}

TEST(WorkerTest, MalformedRequests) {
    mock_executor exec;
    EXPECT_CALL(exec, execute(_)).Times(0);

    json missing = handle_request(json::parse(R"({"id": 1, "type": "execute", "language": "python"})"), exec);
    EXPECT_EQ(missing["id"], 1);
    EXPECT_TRUE(missing.contains("error"));

    json unknown = handle_request(json::parse(R"({"id": 2, "type": "compile"})"), exec);
    EXPECT_EQ(unknown["error"], "Unknown request type: compile");

    json not_object = handle_request(json::parse("[1, 2]"), exec);
    EXPECT_TRUE(not_object["id"].is_null());
    EXPECT_TRUE(not_object.contains("error"));
}

TEST(WorkerTest, WorkersDrainClosedQueue) {
    mock_executor exec;
    EXPECT_CALL(exec, execute(_)).Times(10).WillRepeatedly(Return(accepted_with("ok")));

    ostringstream out;
    response_sink sink(out);
    concurrent_queue<message::job> job_queue;

    vector<thread> workers;
    for (size_t i = 0; i < 3; ++i)
        workers.push_back(start_worker(i, job_queue, exec, sink));

    for (int i = 0; i < 10; ++i) {
        message::job job;
        job.line = i + 1;
        job.request = {{"id", i}, {"type", "execute"}, {"source_code", ""}, {"language", "python"}};
        job_queue.push(job);
    }
    job_queue.close();
    for (auto &worker : workers) worker.join();

    // 每个响应占一行，顺序不确定
    istringstream in(out.str());
    string line;
    vector<bool> seen(10, false);
    size_t lines = 0;
    while (getline(in, line)) {
        json response = json::parse(line);
        seen[response["id"].get<int>()] = true;
        EXPECT_EQ(response["result"]["stdout"], "ok");
        ++lines;
    }
    EXPECT_EQ(lines, 10u);
    for (bool s : seen) EXPECT_TRUE(s);
}
