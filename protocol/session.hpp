#ifndef PROTOCOL_SESSION_HPP
#define PROTOCOL_SESSION_HPP

#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "proto/grading.pb.h"
#include "proto/sandbox_message.pb.h"

namespace protocol {

// What a session collected once it was finalized.
struct SessionResult {
  std::vector<proto::TestOutcome> outcomes;
  std::vector<proto::LogEntry> logs;
  proto::TerminationReason termination_reason = proto::TerminationReason::NORMAL;
  std::string fault_message;
};

// Host-side state of a single execution request. Messages from the sandbox
// are fed in by a reader thread while another thread waits for the session to
// be finalized. A session is finalized exactly once, by whichever of these
// happens first: a result for every test, a FATAL message, the exit of the
// sandbox, or a timeout. Afterwards every message is discarded.
class Session {
 public:
  // Returns a new id from a process-wide monotonic counter.
  static int64_t NextCorrelationId();

  Session(int64_t correlation_id, std::vector<std::string> test_names);

  int64_t correlation_id() const { return correlation_id_; }

  // Handles a message read from the sandbox. Returns false if the message was
  // discarded.
  bool OnMessage(const proto::SandboxMessage& message);

  // The sandbox terminated. clean is true if it exited normally with status
  // zero; reason describes the termination otherwise.
  void OnSandboxExit(bool clean, const std::string& reason);

  // Finalizes the session as timed out, unless it already was finalized.
  void OnTimeout();

  // Blocks until the session is finalized or the deadline expires. Returns
  // true if the session is finalized.
  bool WaitUntil(absl::Time deadline);

  bool IsFinalized();
  bool IsReady();
  size_t DiscardedMessages();

  // Returns the collected results if the session is finalized.
  absl::optional<SessionResult> Result();

 private:
  void Finalize(proto::TerminationReason reason, const std::string& message)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const int64_t correlation_id_;
  const std::vector<std::string> test_names_;

  absl::Mutex mutex_;
  bool finalized_ GUARDED_BY(mutex_) = false;
  bool ready_ GUARDED_BY(mutex_) = false;
  size_t resolved_ GUARDED_BY(mutex_) = 0;
  size_t discarded_ GUARDED_BY(mutex_) = 0;
  std::vector<absl::optional<proto::TestOutcome>> outcomes_ GUARDED_BY(mutex_);
  std::vector<proto::LogEntry> logs_ GUARDED_BY(mutex_);
  proto::TerminationReason termination_reason_ GUARDED_BY(mutex_) =
      proto::TerminationReason::NORMAL;
  std::string fault_message_ GUARDED_BY(mutex_);
};

}  // namespace protocol

#endif
