#ifndef RUNTIME_EVALUATOR_HPP
#define RUNTIME_EVALUATOR_HPP

#include <functional>
#include <vector>

#include "proto/grading.pb.h"
#include "runtime/interpreter.hpp"

namespace runtime {

// Runs the assertions of a battery against the state left by the submission.
class BatteryEvaluator {
 public:
  // Called with the index of each test as soon as its outcome is known.
  using OutcomeCallback =
      std::function<void(size_t index, const proto::TestOutcome& outcome)>;

  explicit BatteryEvaluator(Interpreter* interpreter)
      : interpreter_(interpreter) {}

  // Returns one outcome per test, in battery order. An error in one assertion
  // fails that test only.
  std::vector<proto::TestOutcome> Evaluate(const proto::TestBattery& battery,
                                           const OutcomeCallback& callback);

  // Evaluates a single test case.
  proto::TestOutcome EvaluateTest(const proto::TestCase& test);

 private:
  Interpreter* interpreter_;
};

}  // namespace runtime

#endif
