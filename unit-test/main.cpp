#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/fakes.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    std::filesystem::create_directories(codejudge::test::test_sandbox_config().work_dir);
  }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(codejudge::test::test_sandbox_config().work_dir, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = google::GLOG_WARNING;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
