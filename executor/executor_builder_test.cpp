#include "executor/executor_builder.hpp"

#include <stdexcept>

#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using namespace executor;

const constexpr char* kTestDir = "/tmp/code_runner_testdir";

class ExecutorBuilderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.temp_directory = tmp_.Path();
    config_.backend = "local";
  }

  util::TempDir tmp_{kTestDir};
  sandbox::SandboxConfig config_;
};

TEST_F(ExecutorBuilderTest, TestOptionsFromFlags) {
  FLAGS_default_timeout = 4;
  FLAGS_max_timeout = 12;
  FLAGS_max_concurrent_executions = 3;
  ExecutorOptions options = ExecutorBuilder::OptionsFromFlags();
  EXPECT_EQ(options.default_timeout, 4);
  EXPECT_EQ(options.max_timeout, 12);
  EXPECT_EQ(options.max_concurrent_executions, 3);
}

TEST_F(ExecutorBuilderTest, TestSandboxConfigFromFlags) {
  FLAGS_memory_limit_mb = 256;
  FLAGS_backend = "local";
  sandbox::SandboxConfig config = ExecutorBuilder::SandboxConfigFromFlags();
  EXPECT_EQ(config.memory_limit_kb, 256 * 1024);
  EXPECT_EQ(config.backend, "local");
}

TEST_F(ExecutorBuilderTest, TestLocalBackend) {
  std::unique_ptr<Executor> executor =
      ExecutorBuilder::Get(ExecutorOptions(), config_);
  ASSERT_NE(executor, nullptr);
  EXPECT_EQ(executor->Health().backend(), "local");
}

TEST_F(ExecutorBuilderTest, TestUnknownBackend) {
  config_.backend = "vm";
  EXPECT_THROW(ExecutorBuilder::Get(ExecutorOptions(), config_),
               std::invalid_argument);
}

TEST_F(ExecutorBuilderTest, TestTimeoutsMustBePositive) {
  ExecutorOptions options;
  options.max_timeout = 0;
  EXPECT_THROW(ExecutorBuilder::Get(options, config_), std::invalid_argument);
  options.max_timeout = 30;
  options.default_timeout = -1;
  EXPECT_THROW(ExecutorBuilder::Get(options, config_), std::invalid_argument);
  options.default_timeout = 1;
  options.max_timeout = 1;
  EXPECT_NE(ExecutorBuilder::Get(options, config_), nullptr);
}

}  // namespace
