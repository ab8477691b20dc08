#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        runner::setup_test_environment();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
