#include "staging/stager.hpp"

#include <ctime>
#include <random>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"

namespace staging {

Stager::Stager(const std::string& root, std::string extension)
    : extension_(std::move(extension)) {
  util::File::MakeDirs(root);
  root_ = util::File::RealPath(root);
}

std::string Stager::NewId() {
  static const constexpr char* kHexDigits = "0123456789abcdef";
  std::random_device rd;
  std::string id;
  id.reserve(32);
  for (int i = 0; i < 4; i++) {
    uint32_t word = rd();
    for (int j = 0; j < 8; j++) {
      id.push_back(kHexDigits[word & 0xf]);  // NOLINT
      word >>= 4;
    }
  }
  return id;
}

Artifact Stager::Stage(const std::string& code) const {
  Artifact artifact;
  artifact.id = NewId();
  artifact.file_name = artifact.id + extension_;
  artifact.path = util::File::JoinPath(root_, artifact.file_name);
  util::File::WriteContents(artifact.path, code);
  util::File::MakeImmutable(artifact.path);
  KJ_LOG(INFO, "Staged artifact", artifact.id);
  return artifact;
}

void Stager::Release(const Artifact& artifact) const {
  util::File::Remove(artifact.path);
}

size_t Stager::Sweep(int64_t max_age) const {
  int64_t now = time(nullptr);
  size_t removed = 0;
  for (const std::string& path : util::File::ListFiles(root_)) {
    int64_t mtime = util::File::ModificationTime(path);
    if (mtime < 0) continue;
    // Files are sorted oldest first.
    if (now - mtime <= max_age) break;
    try {
      util::File::Remove(path);
      removed++;
    } catch (const std::system_error& e) {
      KJ_LOG(WARNING, "Cannot remove stale artifact", path, e.what());
    }
  }
  if (removed > 0) KJ_LOG(INFO, "Swept stale artifacts", removed);
  return removed;
}

}  // namespace staging
