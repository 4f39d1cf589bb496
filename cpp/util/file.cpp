#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadBufferSize = 64 * 1024;

[[noreturn]] void ThrowErrno(int err, const std::string& what) {
  throw std::system_error(err, std::system_category(), what);
}

// Entries collected by the nftw callback, which cannot capture.
thread_local std::vector<std::pair<int64_t, std::string>>* listed_files;

int CollectFile(const char* fpath, const struct stat* sb, int typeflag,
                struct FTW* /*ftwbuf*/) {
  if (typeflag == FTW_F) listed_files->emplace_back(sb->st_mtime, fpath);
  return 0;
}

int RemoveEntry(const char* fpath, const struct stat* /*sb*/, int /*typeflag*/,
                struct FTW* /*ftwbuf*/) {
  return remove(fpath);
}

void WriteAll(int fd, const std::string& content, const std::string& path) {
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos,  // NOLINT
                            content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) ThrowErrno(errno, "write " + path);
    pos += written;
  }
}

}  // namespace

namespace util {

std::vector<std::string> File::ListFiles(const std::string& path) {
  MakeDirs(path);
  std::vector<std::pair<int64_t, std::string>> files;
  listed_files = &files;
  int ret = nftw(path.c_str(), CollectFile, 64, FTW_PHYS | FTW_MOUNT);
  int err = errno;
  listed_files = nullptr;
  if (ret == -1) ThrowErrno(err, "list " + path);
  std::stable_sort(files.begin(), files.end(),
                   [](const std::pair<int64_t, std::string>& a,
                      const std::pair<int64_t, std::string>& b) {
                     return a.first < b.first;
                   });
  std::vector<std::string> paths;
  paths.reserve(files.size());
  for (auto& file : files) paths.push_back(std::move(file.second));
  return paths;
}

void File::WriteContents(const std::string& path, const std::string& content) {
  if (!BaseDir(path).empty()) MakeDirs(BaseDir(path));
  std::string temp = path + ".XXXXXX";
  kj::AutoCloseFd fd(mkostemp(&temp[0], O_CLOEXEC));
  if (fd.get() == -1) ThrowErrno(errno, "write " + path);
  // The temporary file goes away on every path, the link keeps the data.
  KJ_DEFER(remove(temp.c_str()));
  WriteAll(fd, content, temp);
  if (fsync(fd) == -1) ThrowErrno(errno, "fsync " + temp);
  if (link(temp.c_str(), path.c_str()) == -1) {
    ThrowErrno(errno, "write " + path);
  }
}

std::string File::ReadContents(const std::string& path) {
  kj::AutoCloseFd fd(open(path.c_str(), O_CLOEXEC | O_RDONLY));  // NOLINT
  if (fd.get() == -1) ThrowErrno(errno, "read " + path);
  std::string content;
  char buf[kReadBufferSize];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) ThrowErrno(errno, "read " + path);
    if (amount == 0) break;
    content.append(buf, amount);
  }
  return content;
}

void File::MakeDirs(const std::string& path) {
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    std::string dir = path.substr(0, pos);
    if (mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      ThrowErrno(errno, "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1) ThrowErrno(errno, "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (nftw(path.c_str(), RemoveEntry, 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) ==
      -1) {
    ThrowErrno(errno, "removetree " + path);
  }
}

void File::MakeImmutable(const std::string& path) {
  if (chmod(path.c_str(), S_IRUSR | S_IRGRP | S_IROTH) == -1) {
    ThrowErrno(errno, "chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::RealPath(const std::string& path) {
  char resolved[PATH_MAX + 1] = {};
  if (realpath(path.c_str(), resolved) == nullptr) {  // NOLINT
    ThrowErrno(errno, "realpath " + path);
  }
  return resolved;  // NOLINT
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return -1;
  return st.st_size;
}

int64_t File::ModificationTime(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return -1;
  return st.st_mtime;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string tmp = File::JoinPath(base, "XXXXXX");
  if (mkdtemp(&tmp[0]) == nullptr) ThrowErrno(errno, "mkdtemp " + base);
  path_ = tmp;
}

TempDir::~TempDir() {  // NOLINT
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
}

}  // namespace util
