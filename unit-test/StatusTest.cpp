#include "common/status.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;

TEST(StatusTest, Judge0CompatibleIds) {
    EXPECT_EQ(get_status_id(status::ACCEPTED), 3);
    EXPECT_EQ(get_status_id(status::TIME_LIMIT_EXCEEDED), 5);
    EXPECT_EQ(get_status_id(status::COMPILATION_ERROR), 6);
    EXPECT_EQ(get_status_id(status::RUNTIME_ERROR), 11);
}

TEST(StatusTest, NonJudge0StatusesShareMinusOne) {
    for (status s : {status::UNSUPPORTED, status::COMPILER_NOT_FOUND, status::RUNTIME_NOT_FOUND, status::INTERNAL_ERROR})
        EXPECT_EQ(get_status_id(s), -1);
}

TEST(StatusTest, DisplayMessages) {
    EXPECT_STREQ(get_display_message(status::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(status::COMPILATION_ERROR), "Compilation Error");
    EXPECT_STREQ(get_display_message(status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_STREQ(get_display_message(status::RUNTIME_ERROR), "Runtime Error");
    EXPECT_STREQ(get_display_message(status::UNSUPPORTED), "Unsupported");
    EXPECT_STREQ(get_display_message(status::COMPILER_NOT_FOUND), "Compiler Not Found");
    EXPECT_STREQ(get_display_message(status::RUNTIME_NOT_FOUND), "Runtime Not Found");
    EXPECT_STREQ(get_display_message(status::INTERNAL_ERROR), "Internal Error");
}
