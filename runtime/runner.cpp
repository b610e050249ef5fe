#include "runtime/runner.hpp"

#include <new>
#include <vector>

#include "glog/logging.h"
#include "protocol/framing.hpp"
#include "runtime/dom.hpp"
#include "runtime/evaluator.hpp"
#include "runtime/html.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/stylesheet.hpp"

namespace runtime {

void Runner::Send(proto::SandboxMessage* message) {
  message->set_correlation_id(correlation_id_);
  if (!protocol::WriteMessage(output_fd_, *message)) {
    throw HostChannelError("Failed to write to the host");
  }
}

void Runner::SendFatal(const std::string& message) {
  LOG(INFO) << "Submission faulted: " << message;
  proto::SandboxMessage fatal;
  fatal.set_type(proto::MessageType::FATAL);
  fatal.mutable_fatal()->set_message(message);
  Send(&fatal);
}

bool Runner::Run(const proto::ExecutionRequest& request) {
  correlation_id_ = request.correlation_id();
  proto::SandboxMessage ready;
  ready.set_type(proto::MessageType::READY);
  ready.mutable_ready();
  Send(&ready);

  const proto::Submission& submission = request.submission();
  Document document;
  std::vector<std::string> style_blocks;
  ParseHtml(submission.markup(), &document, &style_blocks);
  Stylesheet stylesheet;
  stylesheet.Append(submission.style());
  for (const std::string& block : style_blocks) stylesheet.Append(block);
  StyleResolver styles(&stylesheet);
  VLOG(1) << "Document has " << document.NodeCount() << " nodes, "
          << stylesheet.rules().size() << " style rules";

  Interpreter interpreter(
      &document, &styles,
      [this](const std::string& level, const std::string& text) {
        proto::SandboxMessage log;
        log.set_type(proto::MessageType::LOG);
        log.mutable_log()->set_level(level);
        log.mutable_log()->set_text(text);
        Send(&log);
      });
  try {
    interpreter.RunScript(submission.script());
  } catch (const ScriptError& e) {
    SendFatal(e.what());
    return false;
  } catch (const std::bad_alloc&) {
    SendFatal("RangeError: out of memory");
    return false;
  }

  BatteryEvaluator evaluator(&interpreter);
  evaluator.Evaluate(
      request.battery(),
      [this](size_t index, const proto::TestOutcome& outcome) {
        proto::SandboxMessage result;
        result.set_type(proto::MessageType::TEST_RESULT);
        proto::TestResultPayload* payload = result.mutable_test_result();
        payload->set_index(index);
        payload->set_name(outcome.name());
        payload->set_passed(outcome.passed());
        payload->set_message(outcome.message());
        if (outcome.has_captured_value()) {
          payload->set_captured_value(outcome.captured_value());
        }
        Send(&result);
      });
  return true;
}

}  // namespace runtime
