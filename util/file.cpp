#include "util/file.hpp"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "glog/logging.h"

namespace util {
namespace {

constexpr size_t kReadBufferSize = 32 * 1024;

[[noreturn]] void Fail(const std::string& what, const std::string& path) {
  throw std::system_error(errno, std::system_category(), what + " " + path);
}

// Owns a descriptor. Close reports errors, the destructor cannot.
class Descriptor {
 public:
  Descriptor(int fd, const std::string& path) : fd_(fd), path_(path) {
    if (fd_ == -1) Fail("open", path_);
  }
  ~Descriptor() {
    if (fd_ != -1) close(fd_);
  }
  Descriptor(const Descriptor&) = delete;
  Descriptor& operator=(const Descriptor&) = delete;

  int fd() const { return fd_; }

  void WriteAll(const std::string& data) {
    size_t pos = 0;
    while (pos < data.size()) {
      ssize_t n = write(fd_, data.data() + pos, data.size() - pos);
      if (n == -1 && errno == EINTR) continue;
      if (n == -1) Fail("write", path_);
      pos += n;
    }
    if (fsync(fd_) == -1) Fail("fsync", path_);
  }

  void Close() {
    int fd = fd_;
    fd_ = -1;
    if (close(fd) == -1) Fail("close", path_);
  }

 private:
  int fd_;
  std::string path_;
};

}  // namespace

std::string File::ReadAll(const std::string& path) {
  Descriptor file(open(path.c_str(), O_RDONLY | O_CLOEXEC), path);
  std::string contents;
  std::vector<char> buf(kReadBufferSize);
  while (true) {
    ssize_t n = read(file.fd(), buf.data(), buf.size());
    if (n == -1 && errno == EINTR) continue;
    if (n == -1) Fail("read", path);
    if (n == 0) break;
    contents.append(buf.data(), n);
  }
  file.Close();
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(Dirname(path));
  std::vector<char> temp(path.begin(), path.end());
  const std::string suffix = ".XXXXXX";
  temp.insert(temp.end(), suffix.begin(), suffix.end());
  temp.push_back('\0');
  const std::string temp_path = [&temp, &path]() {
    int fd = mkostemp(temp.data(), O_CLOEXEC);
    if (fd == -1) Fail("mkostemp", path);
    close(fd);
    return std::string(temp.data());
  }();
  try {
    Descriptor file(open(temp_path.c_str(), O_WRONLY | O_CLOEXEC), temp_path);
    file.WriteAll(contents);
    file.Close();
    if (overwrite) {
      if (rename(temp_path.c_str(), path.c_str()) == -1) Fail("rename", path);
    } else {
      // link fails with EEXIST instead of replacing path.
      if (link(temp_path.c_str(), path.c_str()) == -1) Fail("link", path);
      unlink(temp_path.c_str());
    }
  } catch (const std::system_error&) {
    unlink(temp_path.c_str());
    throw;
  }
}

void File::Append(const std::string& path, const std::string& contents) {
  MakeDirs(Dirname(path));
  Descriptor file(open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                       S_IRUSR | S_IWUSR),
                  path);
  file.WriteAll(contents);
  file.Close();
}

void File::MakeDirs(const std::string& path) {
  size_t pos = 0;
  do {
    pos = path.find('/', pos + 1);
    std::string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      Fail("mkdir", dir);
    }
  } while (pos != std::string::npos);
}

void File::RemoveTree(const std::string& path) {
  auto remove_entry = [](const char* entry, const struct stat*, int,
                         struct FTW*) { return remove(entry); };
  if (nftw(path.c_str(), remove_entry, 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) ==
      -1) {
    Fail("remove", path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && second[0] == '/') return second;
  return first + "/" + second;
}

std::string File::Dirname(const std::string& path) {
  size_t pos = path.rfind('/');
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

bool File::Exists(const std::string& path) {
  return access(path.c_str(), F_OK) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string pattern = File::JoinPath(base, "XXXXXX");
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) Fail("mkdtemp", base);
  path_ = buf.data();
}

TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
