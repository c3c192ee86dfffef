#include <glog/logging.h>
#include <filesystem>
#include <system_error>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "starjudge/config.hpp"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    starjudge::test::setup_test_environment();
  }
  virtual void TearDown() {
    // DEBUG 模式下保留评测产生的文件
    if (starjudge::DEBUG) return;
    std::error_code ec;
    std::filesystem::remove_all(starjudge::WORK_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
