#include "store/file_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/util/delimited_message_util.h"
#include "util/file.hpp"

namespace store {

namespace {

// Maps an arbitrary id to a single safe path component. Escapes always take
// three characters, so distinct ids never collide.
std::string EscapeComponent(const std::string& name) {
  std::string escaped;
  for (unsigned char c : name) {
    if (absl::ascii_isalnum(c) || c == '-' || c == '_' ||
        (c == '.' && !escaped.empty())) {
      escaped += c;
    } else {
      absl::StrAppend(&escaped, "%",
                      absl::Hex(static_cast<uint32_t>(c), absl::kZeroPad2));
    }
  }
  return escaped.empty() ? "%" : escaped;
}

// Holds an exclusive flock on path for its lifetime.
class FileLock {
 public:
  explicit FileLock(const std::string& path) {
    fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd_ == -1) {
      throw std::system_error(errno, std::system_category(), "open " + path);
    }
    while (flock(fd_, LOCK_EX) == -1) {
      if (errno == EINTR) continue;
      int error = errno;
      close(fd_);
      throw std::system_error(error, std::system_category(), "flock " + path);
    }
  }
  ~FileLock() {
    flock(fd_, LOCK_UN);
    close(fd_);
  }
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

 private:
  int fd_ = -1;
};

}  // namespace

FileStore::FileStore(std::string root) : root_(std::move(root)) {}

std::string FileStore::KeyDir(const std::string& user_id,
                              const std::string& challenge_id) const {
  return util::File::JoinPath(
      util::File::JoinPath(root_, EscapeComponent(user_id)),
      EscapeComponent(challenge_id));
}

proto::StoredProgress FileStore::ReadProgress(const std::string& dir) const {
  proto::StoredProgress stored;
  std::string path = util::File::JoinPath(dir, kProgressFile);
  if (!util::File::Exists(path)) return stored;
  if (!stored.ParseFromString(util::File::ReadAll(path))) {
    throw StoreUnavailable("Corrupted progress file " + path);
  }
  return stored;
}

void FileStore::AppendAttempt(const proto::Attempt& attempt) {
  std::string frame;
  {
    google::protobuf::io::StringOutputStream output(&frame);
    if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(attempt,
                                                                    &output)) {
      throw StoreUnavailable("Cannot serialize the attempt");
    }
  }
  std::string dir = KeyDir(attempt.submission().user_id(),
                           attempt.submission().challenge_id());
  try {
    util::File::MakeDirs(dir);
    FileLock lock(util::File::JoinPath(dir, kLockFile));
    util::File::Append(util::File::JoinPath(dir, kAttemptsFile), frame);
  } catch (const std::system_error& e) {
    throw StoreUnavailable(e.what());
  }
}

absl::optional<proto::ProgressRecord> FileStore::UpsertProgress(
    const std::string& user_id, const std::string& challenge_id,
    const MergeFunction& merge) {
  std::string dir = KeyDir(user_id, challenge_id);
  try {
    proto::StoredProgress read = ReadProgress(dir);
    absl::optional<proto::ProgressRecord> prior;
    if (read.version() > 0) prior = read.record();
    proto::ProgressRecord merged = merge(prior);

    util::File::MakeDirs(dir);
    FileLock lock(util::File::JoinPath(dir, kLockFile));
    if (ReadProgress(dir).version() != read.version()) {
      VLOG(1) << "Lost the progress update race for " << dir;
      return absl::nullopt;
    }
    proto::StoredProgress next;
    next.set_version(read.version() + 1);
    *next.mutable_record() = merged;
    std::string data;
    if (!next.SerializeToString(&data)) {
      throw StoreUnavailable("Cannot serialize the progress record");
    }
    util::File::Write(util::File::JoinPath(dir, kProgressFile), data,
                      /*overwrite=*/true);
    return merged;
  } catch (const std::system_error& e) {
    throw StoreUnavailable(e.what());
  }
}

absl::optional<proto::ProgressRecord> FileStore::GetProgress(
    const std::string& user_id, const std::string& challenge_id) {
  try {
    proto::StoredProgress stored = ReadProgress(KeyDir(user_id, challenge_id));
    if (stored.version() == 0) return absl::nullopt;
    return stored.record();
  } catch (const std::system_error& e) {
    throw StoreUnavailable(e.what());
  }
}

std::vector<proto::Attempt> FileStore::ListAttempts(
    const std::string& user_id, const std::string& challenge_id) {
  std::string path =
      util::File::JoinPath(KeyDir(user_id, challenge_id), kAttemptsFile);
  std::vector<proto::Attempt> attempts;
  std::string data;
  try {
    if (!util::File::Exists(path)) return attempts;
    data = util::File::ReadAll(path);
  } catch (const std::system_error& e) {
    throw StoreUnavailable(e.what());
  }
  google::protobuf::io::ArrayInputStream input(data.data(), data.size());
  while (true) {
    proto::Attempt attempt;
    bool clean_eof = false;
    if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(
            &attempt, &input, &clean_eof)) {
      // A writer that died mid-append leaves a truncated last record.
      if (!clean_eof) LOG(WARNING) << "Ignoring a truncated record in " << path;
      break;
    }
    attempts.push_back(std::move(attempt));
  }
  return attempts;
}

}  // namespace store
