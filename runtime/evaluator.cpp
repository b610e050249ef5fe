#include "runtime/evaluator.hpp"

#include <new>

#include "glog/logging.h"

namespace runtime {

proto::TestOutcome BatteryEvaluator::EvaluateTest(const proto::TestCase& test) {
  proto::TestOutcome outcome;
  outcome.set_name(test.name());
  try {
    Value value = interpreter_->EvaluateAssertion(test.assertion());
    outcome.set_captured_value(value.Inspect());
    outcome.set_passed(value.Truthy());
    if (!outcome.passed()) {
      outcome.set_message("assertion evaluated to " + value.Inspect());
    }
  } catch (const ScriptError& e) {
    outcome.set_passed(false);
    outcome.set_message(e.what());
  } catch (const std::bad_alloc&) {
    outcome.set_passed(false);
    outcome.set_message("RangeError: out of memory");
  }
  return outcome;
}

std::vector<proto::TestOutcome> BatteryEvaluator::Evaluate(
    const proto::TestBattery& battery, const OutcomeCallback& callback) {
  std::vector<proto::TestOutcome> outcomes;
  outcomes.reserve(battery.tests_size());
  for (int i = 0; i < battery.tests_size(); i++) {
    outcomes.push_back(EvaluateTest(battery.tests(i)));
    VLOG(1) << "Test " << i << " (" << battery.tests(i).name()
            << "): " << (outcomes.back().passed() ? "passed" : "failed");
    if (callback) callback(i, outcomes.back());
  }
  return outcomes;
}

}  // namespace runtime
