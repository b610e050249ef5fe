#include <signal.h>
#include <unistd.h>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "protocol/framing.hpp"
#include "runtime/runner.hpp"

// Runs inside the sandbox: reads one request from stdin, writes the messages
// to stdout and logs to stderr.
int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  signal(SIGPIPE, SIG_IGN);

  proto::ExecutionRequest request;
  protocol::MessageReader reader(STDIN_FILENO);
  protocol::MessageReader::Status status = reader.Read(&request);
  if (status != protocol::MessageReader::Status::OK) {
    LOG(ERROR) << "Invalid execution request";
    return 2;
  }
  VLOG(1) << "Session " << request.correlation_id() << " with "
          << request.battery().tests_size() << " tests";
  try {
    runtime::Runner(STDOUT_FILENO).Run(request);
  } catch (const runtime::HostChannelError& e) {
    LOG(ERROR) << e.what();
    return 3;
  }
  return 0;
}
