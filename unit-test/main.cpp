#include <signal.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        dcx::test::setup_test_environment();
    }

    void TearDown() override {
        if (!dcx::DEBUG) {
            std::error_code ec;
            std::filesystem::remove_all(dcx::RUN_DIR, ec);
        }
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 沙箱中的程序可能提前关闭标准输入
    signal(SIGPIPE, SIG_IGN);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
