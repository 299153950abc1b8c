#include <gatecore/log/log.h>
#include <gtest/gtest.h>

class test_env : public testing::Environment {
  public:
    void SetUp() override { gatecore::set_log_level(gatecore::log_level::warn); }

    void TearDown() override { gatecore::log_flush(); }
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new test_env);

    return RUN_ALL_TESTS();
}
