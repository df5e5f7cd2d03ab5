#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fsroute::test {

// ScopedTempDir: creates a unique temporary directory under the system temp directory and removes it
// (recursively) on destruction. Used as a content root by most tests.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "fsroute-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Create (or overwrite) the file at 'relativePath', creating missing parent directories.
  // Returns its absolute path.
  std::filesystem::path writeFile(std::string_view relativePath, std::string_view content) const;

  // Create the directory at 'relativePath' (and missing parents). Returns its absolute path.
  std::filesystem::path makeDir(std::string_view relativePath) const;

  // Remove the file or directory tree at 'relativePath'.
  void remove(std::string_view relativePath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a uniquely named file created inside an existing ScopedTempDir and removed on destruction.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile();

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }
  [[nodiscard]] std::string filename() const { return _path.filename().string(); }

 private:
  void cleanup() noexcept;

  std::filesystem::path _path;
};

}  // namespace fsroute::test
