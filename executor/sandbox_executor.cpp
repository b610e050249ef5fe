#include "executor/sandbox_executor.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <thread>

#include "glog/logging.h"
#include "protocol/framing.hpp"
#include "protocol/session.hpp"
#include "proto/sandbox_message.pb.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

// Owns a file descriptor.
class Fd {
 public:
  Fd() = default;
  ~Fd() { Close(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const { return fd_; }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ != -1) close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  Fd read_end;
  Fd write_end;
};

void MakePipe(Pipe* pipe) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw executor::ExecutionError(std::string("pipe2: ") + strerror(errno));
  }
  pipe->read_end.Reset(fds[0]);
  pipe->write_end.Reset(fds[1]);
}

void IgnoreSigpipe() {
  // Writing the request to a sandbox that already died must fail with EPIPE
  // instead of killing the host.
  static bool ignored = []() {
    signal(SIGPIPE, SIG_IGN);
    return true;
  }();
  (void)ignored;
}

}  // namespace

namespace executor {

ExecutionLimits ExecutionLimits::FromFlags() {
  ExecutionLimits limits;
  limits.memory_kb = FLAGS_sandbox_memory_kb;
  limits.max_files = FLAGS_sandbox_max_files;
  limits.max_procs = FLAGS_sandbox_max_procs;
  limits.stack_kb = FLAGS_sandbox_stack_kb;
  limits.isolate_network = FLAGS_sandbox_isolate_network;
  return limits;
}

SandboxExecutor::SandboxExecutor(std::string id, std::string runtime_path,
                                 std::string temp_directory,
                                 ExecutionLimits limits)
    : id_(std::move(id)),
      runtime_path_(std::move(runtime_path)),
      temp_directory_(std::move(temp_directory)),
      limits_(limits) {
  IgnoreSigpipe();
}

std::string SandboxExecutor::RuntimePath() const {
  if (runtime_path_.find('/') != std::string::npos) {
    if (access(runtime_path_.c_str(), X_OK) == -1) {
      throw ExecutionError("Sandbox runtime " + runtime_path_ +
                           " is not executable");
    }
    return runtime_path_;
  }
  std::string path = util::which(runtime_path_);
  if (path.empty()) {
    throw ExecutionError("Sandbox runtime " + runtime_path_ +
                         " not found in PATH");
  }
  return path;
}

ExecutionResult SandboxExecutor::Execute(const proto::Submission& submission,
                                         const proto::TestBattery& battery,
                                         absl::Duration time_budget) {
  const std::string runtime = RuntimePath();
  util::TempDir tmp(temp_directory_);
  if (FLAGS_keep_sandboxes) tmp.Keep();
  std::string sandbox_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(sandbox_dir);

  Pipe request_pipe;
  Pipe frame_pipe;
  Pipe stderr_pipe;
  MakePipe(&request_pipe);
  MakePipe(&frame_pipe);
  MakePipe(&stderr_pipe);

  sandbox::ExecutionOptions exec_options(sandbox_dir, runtime);
  exec_options.memory_limit_kb = limits_.memory_kb;
  exec_options.max_files = limits_.max_files;
  exec_options.max_procs = limits_.max_procs;
  exec_options.max_stack_kb = limits_.stack_kb;
  exec_options.isolate_network = limits_.isolate_network;
  // The wall clock deadline below is what bounds the submission, the CPU
  // limit only backs it up.
  exec_options.cpu_limit_millis =
      absl::ToInt64Milliseconds(time_budget) + 1000;
  exec_options.max_file_size_kb = 0;
  exec_options.stdin_fd = request_pipe.read_end.Get();
  exec_options.stdout_fd = frame_pipe.write_end.Get();
  exec_options.stderr_fd = stderr_pipe.write_end.Get();

  proto::ExecutionRequest request;
  request.set_correlation_id(protocol::Session::NextCorrelationId());
  *request.mutable_submission() = submission;
  *request.mutable_battery() = battery;
  std::vector<std::string> test_names;
  for (const proto::TestCase& test : battery.tests()) {
    test_names.push_back(test.name());
  }
  protocol::Session session(request.correlation_id(), std::move(test_names));

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw ExecutionError("No sandbox available");
  std::string error_msg;
  absl::Time start = absl::Now();
  if (!sb->Start(exec_options, &error_msg)) {
    throw ExecutionError("Cannot start the sandbox: " + error_msg);
  }
  LOG(INFO) << "[" << id_ << "] Session " << request.correlation_id()
            << " started for " << submission.user_id() << "/"
            << submission.challenge_id() << " in " << sandbox_dir;
  request_pipe.read_end.Close();
  frame_pipe.write_end.Close();
  stderr_pipe.write_end.Close();

  std::thread writer([&request_pipe, &request, this]() {
    if (!protocol::WriteMessage(request_pipe.write_end.Get(), request)) {
      LOG(WARNING) << "[" << id_ << "] Could not send the request of session "
                   << request.correlation_id();
    }
    request_pipe.write_end.Close();
  });
  std::thread reader([&frame_pipe, &session, this]() {
    protocol::MessageReader frames(frame_pipe.read_end.Get());
    proto::SandboxMessage message;
    while (true) {
      protocol::MessageReader::Status status = frames.Read(&message);
      if (status == protocol::MessageReader::Status::END_OF_STREAM) break;
      if (status == protocol::MessageReader::Status::MALFORMED) {
        LOG(WARNING) << "[" << id_ << "] Malformed frame from session "
                     << session.correlation_id();
        break;
      }
      session.OnMessage(message);
      message.Clear();
    }
  });
  std::thread stderr_drainer([&stderr_pipe, &session, this]() {
    char buf[4096];
    ssize_t num_read = 0;
    std::string pending;
    while ((num_read = read(stderr_pipe.read_end.Get(), buf, sizeof(buf))) !=
           0) {
      if (num_read == -1) {
        if (errno == EINTR) continue;
        break;
      }
      pending.append(buf, num_read);
      size_t newline = 0;
      while ((newline = pending.find('\n')) != std::string::npos) {
        VLOG(2) << "[" << id_ << "] runtime " << session.correlation_id()
                << ": " << pending.substr(0, newline);
        pending.erase(0, newline + 1);
      }
    }
  });
  sandbox::ExecutionInfo info;
  std::thread monitor([&sb, &info, &reader, &session, this]() {
    std::string wait_error;
    bool waited = sb->Wait(&info, &wait_error);
    // Frames written before the exit are still in the pipe.
    reader.join();
    if (!waited) {
      LOG(ERROR) << "[" << id_ << "] " << wait_error;
      session.OnSandboxExit(false, wait_error);
      return;
    }
    bool clean = info.signal == 0 && info.status_code == 0 && !info.killed;
    std::string reason = info.message;
    if (reason.empty()) {
      reason = "exit status " + std::to_string(info.status_code);
    }
    session.OnSandboxExit(clean, reason);
  });

  if (!session.WaitUntil(start + time_budget)) {
    LOG(INFO) << "[" << id_ << "] Session " << request.correlation_id()
              << " timed out";
    session.OnTimeout();
  }
  absl::Duration elapsed = absl::Now() - start;
  // The runtime has nothing left to report: tear the context down.
  sb->Kill();
  monitor.join();
  writer.join();
  stderr_drainer.join();

  absl::optional<protocol::SessionResult> session_result = session.Result();
  CHECK(session_result) << "Session not finalized";
  ExecutionResult result;
  result.outcomes = std::move(session_result->outcomes);
  result.logs = std::move(session_result->logs);
  result.termination_reason = session_result->termination_reason;
  result.fault_message = std::move(session_result->fault_message);
  result.duration_ms = absl::ToInt64Milliseconds(elapsed);
  LOG(INFO) << "[" << id_ << "] Session " << request.correlation_id()
            << " finalized as "
            << proto::TerminationReason_Name(result.termination_reason)
            << " after " << result.duration_ms << "ms, cpu "
            << info.cpu_time_millis << "ms, memory " << info.memory_usage_kb
            << "KiB";
  return result;
}

}  // namespace executor
