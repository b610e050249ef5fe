#ifndef RUNTIME_RUNNER_HPP
#define RUNTIME_RUNNER_HPP

#include <stdexcept>
#include <string>

#include "proto/sandbox_message.pb.h"

namespace runtime {

// The host stopped reading the messages of the runtime.
class HostChannelError : public std::runtime_error {
 public:
  explicit HostChannelError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Executes an ExecutionRequest and streams its progress as SandboxMessages:
// READY first, LOG for every console line, then either one FATAL or one
// TEST_RESULT per test.
class Runner {
 public:
  explicit Runner(int output_fd) : output_fd_(output_fd) {}

  // Returns false if the submission script faulted. Throws HostChannelError.
  bool Run(const proto::ExecutionRequest& request);

 private:
  void Send(proto::SandboxMessage* message);
  void SendFatal(const std::string& message);

  int output_fd_;
  int64_t correlation_id_ = 0;
};

}  // namespace runtime

#endif
