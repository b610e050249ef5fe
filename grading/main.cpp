#include <signal.h>

#include <iostream>
#include <system_error>

#include "content/directory_battery_provider.hpp"
#include "executor/sandbox_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "grading/errors.hpp"
#include "grading/grader.hpp"
#include "store/file_store.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(user, "", "id of the submitting user");
DEFINE_string(challenge, "", "id of the challenge");
DEFINE_int64(content_version, 0, "content version the submission targets");
DEFINE_string(markup, "", "file with the markup payload");
DEFINE_string(style, "", "file with the style payload");
DEFINE_string(script, "", "file with the script payload");
DEFINE_string(client_attempt, "",
              "file with the attempt computed by the client, as JSON");
DEFINE_bool(show_progress, false,
            "print the progress and the attempts of --user on --challenge "
            "instead of submitting");

namespace {

std::string ReadPayload(const std::string& path) {
  if (path.empty()) return "";
  return util::File::ReadAll(path);
}

void PrintJson(const google::protobuf::Message& message) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  CHECK(status.ok()) << status.ToString();
  std::cout << json << std::endl;
}

int ShowProgress(store::ProgressStore* store) {
  absl::optional<proto::ProgressRecord> progress =
      store->GetProgress(FLAGS_user, FLAGS_challenge);
  if (!progress) {
    progress = proto::ProgressRecord();
    progress->set_user_id(FLAGS_user);
    progress->set_challenge_id(FLAGS_challenge);
    progress->set_status(proto::ProgressStatus::NOT_STARTED);
  }
  PrintJson(*progress);
  for (const proto::Attempt& attempt :
       store->ListAttempts(FLAGS_user, FLAGS_challenge)) {
    PrintJson(attempt);
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Grades a submission and records the progress of the user");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();
  signal(SIGPIPE, SIG_IGN);

  if (FLAGS_user.empty() || FLAGS_challenge.empty()) {
    LOG(ERROR) << "You need to specify --user and --challenge";
    return 2;
  }

  store::FileStore store(FLAGS_store_directory);
  try {
    if (FLAGS_show_progress) return ShowProgress(&store);

    grading::SubmitRequest request;
    request.submission.set_user_id(FLAGS_user);
    request.submission.set_challenge_id(FLAGS_challenge);
    request.submission.set_content_version(FLAGS_content_version);
    request.submission.set_markup(ReadPayload(FLAGS_markup));
    request.submission.set_style(ReadPayload(FLAGS_style));
    request.submission.set_script(ReadPayload(FLAGS_script));
    if (!FLAGS_client_attempt.empty()) {
      proto::Attempt attempt;
      auto status = google::protobuf::util::JsonStringToMessage(
          util::File::ReadAll(FLAGS_client_attempt), &attempt);
      if (!status.ok()) {
        LOG(ERROR) << "Invalid client attempt: " << status.ToString();
        return 2;
      }
      request.client_attempt = attempt;
    }

    content::DirectoryBatteryProvider batteries(FLAGS_battery_directory);
    executor::ExecutionLimits limits = executor::ExecutionLimits::FromFlags();
    executor::SandboxExecutor client("client", FLAGS_runtime_path,
                                     FLAGS_temp_directory, limits);
    executor::SandboxExecutor server("server", FLAGS_runtime_path,
                                     FLAGS_temp_directory, limits);
    grading::Grader grader(&batteries, &client, &server, &store,
                           grading::GraderOptions::FromFlags());

    proto::Attempt attempt = grader.Submit(request);
    PrintJson(attempt);
    absl::optional<proto::ProgressRecord> progress =
        store.GetProgress(FLAGS_user, FLAGS_challenge);
    if (progress) PrintJson(*progress);
    return 0;
  } catch (const grading::ValidationMismatch& e) {
    LOG(ERROR) << e.what();
    return 1;
  } catch (const grading::InvalidSubmission& e) {
    LOG(ERROR) << "Invalid submission: " << e.what();
    return 1;
  } catch (const content::BatteryNotFound& e) {
    LOG(ERROR) << e.what();
    return 1;
  } catch (const content::InvalidBattery& e) {
    LOG(ERROR) << "Unusable battery: " << e.what();
    return 2;
  } catch (const grading::PersistenceConflict& e) {
    LOG(ERROR) << "Progress not saved, try again: " << e.what();
    return 2;
  } catch (const grading::PersistenceUnavailable& e) {
    LOG(ERROR) << "Progress store unavailable: " << e.what();
    return 2;
  } catch (const store::StoreUnavailable& e) {
    LOG(ERROR) << "Progress store unavailable: " << e.what();
    return 2;
  } catch (const executor::ExecutionError& e) {
    LOG(ERROR) << "Cannot run the sandbox: " << e.what();
    return 2;
  } catch (const std::system_error& e) {
    LOG(ERROR) << e.what();
    return 2;
  }
}
