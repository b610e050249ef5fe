#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <string>
#include <system_error>

namespace util {

// Filesystem helpers. Every failure is reported as a std::system_error
// carrying the errno of the failed call.
class File {
 public:
  static std::string ReadAll(const std::string& path);

  // Replaces the contents of path atomically: a sibling temporary file is
  // written, synced and moved over path. Unless overwrite is set an existing
  // path is an error (EEXIST). Missing parent directories are created.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Appends contents to path, creating it if needed, and syncs it.
  static void Append(const std::string& path, const std::string& contents);

  // mkdir -p.
  static void MakeDirs(const std::string& path);

  static void RemoveTree(const std::string& path);

  // An absolute second component replaces the first.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Directory part of path: "." when there is none.
  static std::string Dirname(const std::string& path);

  static bool Exists(const std::string& path);
};

// Fresh directory under base, removed with its contents on destruction
// unless Keep was called.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  ~TempDir();

  const std::string& Path() const { return path_; }
  void Keep() { keep_ = true; }

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
