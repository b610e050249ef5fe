#ifndef EXECUTOR_MOCK_EXECUTOR_HPP
#define EXECUTOR_MOCK_EXECUTOR_HPP

#include <string>

#include "executor/executor.hpp"
#include "gmock/gmock.h"

namespace executor {

class MockExecutor : public Executor {
 public:
  MOCK_METHOD(std::string, Id, (), (const, override));
  MOCK_METHOD(ExecutionResult, Execute,
              (const proto::Submission& submission,
               const proto::TestBattery& battery, absl::Duration time_budget),
              (override));
};

}  // namespace executor

#endif
