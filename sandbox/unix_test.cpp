#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <memory>
#include <thread>

namespace {

using ::testing::StartsWith;

using namespace sandbox;

class UnixTest : public ::testing::Test {
 protected:
  ExecutionOptions Options(const std::string& program) {
    return ExecutionOptions(SANDBOX_TEST_DIR, program);
  }
  bool Run(const ExecutionOptions& options, ExecutionInfo* info,
           std::string* error_msg) {
    std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
    if (!sandbox) return false;
    if (!sandbox->Start(options, error_msg)) return false;
    return sandbox->Wait(info, error_msg);
  }
};

TEST_F(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", "bar");
  std::string error_msg;
  EXPECT_FALSE(sandbox->Start(options, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

TEST_F(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options = Options("foo");
  std::string error_msg;
  EXPECT_FALSE(sandbox->Start(options, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

TEST_F(UnixTest, TestReturnArg1) {
  ExecutionOptions options = Options("return_arg1");
  options.args.push_back("15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(Run(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_EQ(info.message, "Non-zero return code");
}

TEST_F(UnixTest, TestSignalArg1) {
  ExecutionOptions options = Options("signal_arg1");
  options.args.push_back("6");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(Run(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_NE(info.message, "");
}

TEST_F(UnixTest, TestWaitArg1) {
  ExecutionOptions options = Options("wait_arg1");
  options.args.push_back("0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(Run(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
  EXPECT_LE(info.cpu_time_millis, 30);
}

TEST_F(UnixTest, TestCpuLimitNotOk) {
  ExecutionOptions options = Options("busywait_arg1");
  options.args.push_back("10");
  options.cpu_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(Run(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGXCPU);
  EXPECT_TRUE(info.killed);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 950);
}

TEST_F(UnixTest, TestRedirectionAndNoLeakedDescriptors) {
  int in_fds[2];
  int out_fds[2];
  ASSERT_EQ(pipe2(in_fds, O_CLOEXEC), 0);
  ASSERT_EQ(pipe2(out_fds, O_CLOEXEC), 0);
  // Not close-on-exec, still must not reach the program.
  int leaked = open("/dev/null", O_RDONLY);
  ASSERT_GE(leaked, 0);

  ExecutionOptions options = Options("echo_stdin");
  options.stdin_fd = in_fds[0];
  options.stdout_fd = out_fds[1];
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options, &error_msg)) << error_msg;
  close(in_fds[0]);
  close(out_fds[1]);
  const std::string payload = "hello sandbox";
  ASSERT_EQ(write(in_fds[1], payload.data(), payload.size()),
            static_cast<ssize_t>(payload.size()));
  close(in_fds[1]);
  std::string output;
  char buf[256];
  ssize_t n = 0;
  while ((n = read(out_fds[0], buf, sizeof(buf))) > 0) output.append(buf, n);
  close(out_fds[0]);
  close(leaked);

  ExecutionInfo info;
  EXPECT_TRUE(sandbox->Wait(&info, &error_msg));
  EXPECT_EQ(output, payload);
  EXPECT_EQ(info.status_code, 0);
}

TEST_F(UnixTest, TestKillProcessGroup) {
  ExecutionOptions options = Options("sleep_forever");
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options, &error_msg)) << error_msg;
  std::thread killer([&sandbox]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    sandbox->Kill();
  });
  ExecutionInfo info;
  EXPECT_TRUE(sandbox->Wait(&info, &error_msg));
  killer.join();
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  // Killing an exited program is harmless.
  sandbox->Kill();
}

}  // namespace
