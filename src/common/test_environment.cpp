#include <voltx/config.hpp>
#include <voltx/status_code.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

class VoltxTestEnv : public testing::Environment
{
 public:
  VoltxTestEnv() noexcept
  {
  }

  ~VoltxTestEnv() override
  {
  }

  // Override this to define how to set up the environment.
  void SetUp() override
  {
    batt::EscapedStringLiteral::max_show_length() = 32;

    voltx::initialize_status_codes();

    // Many tests exercise rejected requests on purpose; keep those warnings out of the output.
    //
    voltx::suppress_log_output_for_test() = true;
  }

  // Override this to define how to tear down the environment.
  void TearDown() override
  {
    voltx::suppress_log_output_for_test() = false;
  }
};

testing::Environment* const voltx_env = testing::AddGlobalTestEnvironment(new VoltxTestEnv);

}  // namespace
