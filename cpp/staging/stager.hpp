#ifndef STAGING_STAGER_HPP
#define STAGING_STAGER_HPP

#include <cstdint>
#include <string>

namespace staging {

// A file holding submitted code, uniquely identified by id.
struct Artifact {
  std::string id;
  // Name of the file inside the staging root.
  std::string file_name;
  // Absolute path of the file.
  std::string path;
};

// Writes submissions to uniquely named, read-only files in a staging root.
// Different Stagers may share the same root.
class Stager {
 public:
  // Creates root if needed. Throws std::system_error if that fails.
  Stager(const std::string& root, std::string extension);

  // Absolute, canonical path of the staging root.
  const std::string& Root() const { return root_; }

  // Durably writes code to a fresh artifact. The file is complete when this
  // returns, and read-only.
  Artifact Stage(const std::string& code) const;

  // Deletes the artifact's file.
  void Release(const Artifact& artifact) const;

  // Deletes the files in the root that were last modified more than max_age
  // seconds ago, and returns how many were deleted. Files that cannot be
  // deleted are skipped; throws std::system_error if the root cannot be
  // listed.
  size_t Sweep(int64_t max_age) const;

  // A new random identifier, 32 lowercase hex digits.
  static std::string NewId();

 private:
  std::string root_;
  std::string extension_;
};

}  // namespace staging

#endif
