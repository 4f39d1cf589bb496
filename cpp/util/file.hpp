#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

namespace util {

// Filesystem helpers. Failures are reported as std::system_error.
class File {
 public:
  // Lists all the regular files under a directory, oldest modification first.
  // The directory is created if it is missing.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Creates path with the given content. The data goes to a temporary file
  // in the same directory that is fsync-ed and then linked to path, so a
  // partially written file is never visible. Fails if path already exists.
  static void WriteContents(const std::string& path,
                            const std::string& content);

  // Reads the whole file.
  static std::string ReadContents(const std::string& path);

  // Creates path and all its missing parents.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Make a file read-only for everyone.
  static void MakeImmutable(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Resolves path to a canonical absolute path. The path must exist.
  static std::string RealPath(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns the last modification time of a file, in seconds since the epoch.
  // Returns a negative number in case of errors.
  static int64_t ModificationTime(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);
  ~TempDir();
  KJ_DISALLOW_COPY(TempDir);

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace util

#endif
