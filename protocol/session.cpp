#include "protocol/session.hpp"

#include <atomic>

#include "glog/logging.h"

namespace protocol {

int64_t Session::NextCorrelationId() {
  static std::atomic<int64_t> next_id{1};
  return next_id++;
}

Session::Session(int64_t correlation_id, std::vector<std::string> test_names)
    : correlation_id_(correlation_id), test_names_(std::move(test_names)) {
  absl::MutexLock lock(&mutex_);
  outcomes_.resize(test_names_.size());
}

bool Session::OnMessage(const proto::SandboxMessage& message) {
  absl::MutexLock lock(&mutex_);
  auto discard = [this, &message](const char* why) {
    VLOG(1) << "Session " << correlation_id_ << ": discarding "
            << proto::MessageType_Name(message.type()) << " message, " << why;
    discarded_++;
    return false;
  };
  if (message.correlation_id() != correlation_id_) {
    return discard("foreign correlation id");
  }
  if (finalized_) return discard("session already finalized");

  switch (message.type()) {
    case proto::MessageType::READY:
      ready_ = true;
      return true;
    case proto::MessageType::LOG: {
      proto::LogEntry entry;
      entry.set_level(message.log().level());
      entry.set_text(message.log().text());
      logs_.push_back(std::move(entry));
      return true;
    }
    case proto::MessageType::TEST_RESULT: {
      if (!message.has_test_result()) return discard("missing payload");
      const proto::TestResultPayload& result = message.test_result();
      if (result.index() < 0 ||
          static_cast<size_t>(result.index()) >= outcomes_.size()) {
        return discard("index out of range");
      }
      absl::optional<proto::TestOutcome>& slot = outcomes_[result.index()];
      if (slot) return discard("duplicate result");
      slot = proto::TestOutcome();
      slot->set_name(test_names_[result.index()]);
      slot->set_passed(result.passed());
      slot->set_message(result.message());
      if (result.has_captured_value()) {
        slot->set_captured_value(result.captured_value());
      }
      resolved_++;
      if (resolved_ == outcomes_.size()) {
        Finalize(proto::TerminationReason::NORMAL, "");
      }
      return true;
    }
    case proto::MessageType::FATAL:
      Finalize(proto::TerminationReason::FAULT, message.fatal().message());
      return true;
    default:
      return discard("unknown type");
  }
}

void Session::OnSandboxExit(bool clean, const std::string& reason) {
  absl::MutexLock lock(&mutex_);
  if (finalized_) return;
  // A battery without tests completes when the program exits normally.
  if (clean && resolved_ == outcomes_.size()) {
    Finalize(proto::TerminationReason::NORMAL, "");
    return;
  }
  Finalize(proto::TerminationReason::CRASH, "sandbox exited: " + reason);
}

void Session::OnTimeout() {
  absl::MutexLock lock(&mutex_);
  if (finalized_) return;
  Finalize(proto::TerminationReason::TIMEOUT, "timeout");
}

void Session::Finalize(proto::TerminationReason reason,
                       const std::string& message) {
  finalized_ = true;
  termination_reason_ = reason;
  fault_message_ = message;
  for (size_t i = 0; i < outcomes_.size(); i++) {
    if (outcomes_[i]) continue;
    outcomes_[i] = proto::TestOutcome();
    outcomes_[i]->set_name(test_names_[i]);
    outcomes_[i]->set_passed(false);
    outcomes_[i]->set_message(message);
  }
  VLOG(1) << "Session " << correlation_id_ << " finalized: "
          << proto::TerminationReason_Name(reason);
}

bool Session::WaitUntil(absl::Time deadline) {
  absl::MutexLock lock(&mutex_);
  return mutex_.AwaitWithDeadline(absl::Condition(&finalized_), deadline);
}

bool Session::IsFinalized() {
  absl::MutexLock lock(&mutex_);
  return finalized_;
}

bool Session::IsReady() {
  absl::MutexLock lock(&mutex_);
  return ready_;
}

size_t Session::DiscardedMessages() {
  absl::MutexLock lock(&mutex_);
  return discarded_;
}

absl::optional<SessionResult> Session::Result() {
  absl::MutexLock lock(&mutex_);
  if (!finalized_) return absl::nullopt;
  SessionResult result;
  for (const auto& outcome : outcomes_) result.outcomes.push_back(*outcome);
  result.logs = logs_;
  result.termination_reason = termination_reason_;
  result.fault_message = fault_message_;
  return result;
}

}  // namespace protocol
