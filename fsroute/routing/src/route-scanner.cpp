#include "fsroute/route-scanner.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "fsroute/errors.hpp"
#include "fsroute/log.hpp"
#include "fsroute/route-kind.hpp"
#include "fsroute/timedef.hpp"
#include "fsroute/timestring.hpp"

namespace fsroute {

namespace {

// Names that the path normalizer would never let through cannot be routes.
constexpr bool IsAddressableChar(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return uch >= 0x20U && uch != 0x7FU && ch != '\\' && ch != '%';
}

SysTimePoint LastWriteTime(const std::filesystem::path& path, std::error_code& ec) {
  const auto writeTime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return kInvalidTimePoint;
  }
  return std::chrono::clock_cast<SysClock>(writeTime);
}

}  // namespace

std::string JoinRouteKey(std::string_view parent, std::string_view name) {
  std::string key;
  key.reserve(parent.size() + 1U + name.size());
  key.append(parent);
  if (!parent.empty()) {
    key.push_back('/');
  }
  key.append(name);
  return key;
}

bool RouteScanner::isIndexableName(std::string_view name) const noexcept {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  if (!_config.showHiddenFiles && name.front() == '.') {
    return false;
  }
  if (_config.skipUnderscorePrefixed && name.front() == '_') {
    return false;
  }
  return std::ranges::all_of(name, IsAddressableChar);
}

std::filesystem::path RouteScanner::absolutePathOf(std::string_view normalizedPath) const {
  if (normalizedPath.empty()) {
    return _rootPath;
  }
  return _rootPath / normalizedPath;
}

std::shared_ptr<RouteNode> RouteScanner::scanRoot(ScanStats& stats) const {
  std::error_code ec;
  const auto status = std::filesystem::status(_rootPath, ec);
  if (ec || !std::filesystem::exists(status)) {
    throw IndexBuildError("Content root '" + _rootPath.string() + "' does not exist");
  }
  if (!std::filesystem::is_directory(status)) {
    throw IndexBuildError("Content root '" + _rootPath.string() + "' is not a directory");
  }
  if (::access(_rootPath.c_str(), R_OK | X_OK) != 0) {
    throw IndexBuildError("Content root '" + _rootPath.string() + "' is not readable: " + std::strerror(errno));
  }
  vector<DirId> ancestors;
  auto root = scanDirectory(_rootPath, std::string(), stats, ancestors);
  if (!root || root->forbidden) {
    throw IndexBuildError("Unable to read content root '" + _rootPath.string() + "'");
  }
  return root;
}

std::shared_ptr<RouteNode> RouteScanner::scanEntry(const std::string& normalizedPath, ScanStats& stats) const {
  if (normalizedPath.empty()) {
    return scanRoot(stats);
  }
  std::string_view name(normalizedPath);
  if (const auto slashPos = name.rfind('/'); slashPos != std::string_view::npos) {
    name.remove_prefix(slashPos + 1);
  }
  vector<DirId> ancestors;
  return scanEntryImpl(absolutePathOf(normalizedPath), normalizedPath, name, stats, ancestors);
}

std::shared_ptr<RouteNode> RouteScanner::scanEntryImpl(const std::filesystem::path& absolutePath,
                                                       std::string normalizedPath, std::string_view name,
                                                       ScanStats& stats, vector<DirId>& ancestors) const {
  if (!isIndexableName(name)) {
    log::trace("Not indexing '{}'", normalizedPath);
    ++stats.nbSkipped;
    return nullptr;
  }

  std::error_code ec;
  auto status = std::filesystem::symlink_status(absolutePath, ec);
  if (ec || !std::filesystem::exists(status)) {
    return nullptr;
  }
  if (std::filesystem::is_symlink(status)) {
    if (!_config.followSymlinks) {
      log::debug("Skipping symbolic link '{}'", normalizedPath);
      ++stats.nbSkipped;
      return nullptr;
    }
    status = std::filesystem::status(absolutePath, ec);
    if (ec || !std::filesystem::exists(status)) {
      log::warn("Skipping dangling symbolic link '{}'", normalizedPath);
      ++stats.nbSkipped;
      return nullptr;
    }
  }

  if (std::filesystem::is_directory(status)) {
    return scanDirectory(absolutePath, std::move(normalizedPath), stats, ancestors);
  }
  if (!std::filesystem::is_regular_file(status)) {
    log::debug("Skipping special file '{}'", normalizedPath);
    ++stats.nbSkipped;
    return nullptr;
  }
  return scanFile(absolutePath, std::move(normalizedPath), name, stats);
}

std::shared_ptr<RouteNode> RouteScanner::scanFile(const std::filesystem::path& absolutePath,
                                                  std::string normalizedPath, std::string_view name,
                                                  ScanStats& stats) const {
  if (::access(absolutePath.c_str(), R_OK) != 0) {
    log::warn("Skipping unreadable file '{}': {}", absolutePath.string(), std::strerror(errno));
    ++stats.nbSkipped;
    return nullptr;
  }
  std::error_code ec;
  const auto fileSize = std::filesystem::file_size(absolutePath, ec);
  if (ec) {
    log::warn("Skipping file '{}': {}", absolutePath.string(), ec.message());
    ++stats.nbSkipped;
    return nullptr;
  }
  const SysTimePoint lastModified = LastWriteTime(absolutePath, ec);
  if (ec) {
    log::warn("Skipping file '{}': {}", absolutePath.string(), ec.message());
    ++stats.nbSkipped;
    return nullptr;
  }

  auto node = std::make_shared<RouteNode>();
  RouteDescriptor& descriptor = node->descriptor;
  descriptor.normalizedPath = std::move(normalizedPath);
  descriptor.absoluteFilePath = absolutePath;
  descriptor.kind = _config.kindForFileName(name);
  descriptor.targetKind = descriptor.kind;
  descriptor.lastModified = lastModified;
  descriptor.fileSize = static_cast<std::uint64_t>(fileSize);
  node->finalize();
  ++stats.nbFiles;
  return node;
}

std::shared_ptr<RouteNode> RouteScanner::scanDirectory(const std::filesystem::path& absolutePath,
                                                       std::string normalizedPath, ScanStats& stats,
                                                       vector<DirId>& ancestors) const {
  struct stat st{};
  if (::stat(absolutePath.c_str(), &st) != 0) {
    log::warn("Skipping directory '{}': {}", absolutePath.string(), std::strerror(errno));
    ++stats.nbSkipped;
    return nullptr;
  }
  const DirId dirId{st.st_dev, st.st_ino};
  if (std::ranges::find(ancestors, dirId) != ancestors.end()) {
    log::warn("Skipping directory '{}': symbolic link loop", absolutePath.string());
    ++stats.nbSkipped;
    return nullptr;
  }

  auto node = std::make_shared<RouteNode>();
  node->descriptor.normalizedPath = std::move(normalizedPath);
  node->descriptor.absoluteFilePath = absolutePath;
  node->descriptor.kind = RouteKind::Directory;
  node->descriptor.targetKind = RouteKind::Directory;

  std::error_code ec;
  node->descriptor.lastModified = LastWriteTime(absolutePath, ec);

  std::filesystem::directory_iterator it;
  if (::access(absolutePath.c_str(), R_OK | X_OK) == 0) {
    it = std::filesystem::directory_iterator(absolutePath, ec);
  } else {
    ec.assign(errno, std::generic_category());
  }
  if (ec) {
    if (ec == std::errc::permission_denied) {
      log::warn("Directory '{}' is not readable, its subtree is forbidden", absolutePath.string());
      node->forbidden = true;
      node->finalize();
      ++stats.nbForbidden;
      return node;
    }
    log::warn("Skipping directory '{}': {}", absolutePath.string(), ec.message());
    ++stats.nbSkipped;
    return nullptr;
  }

  ancestors.push_back(dirId);
  const std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const std::filesystem::path& childPath = it->path();
    std::string name = childPath.filename().string();
    auto child = scanEntryImpl(childPath, JoinRouteKey(node->descriptor.normalizedPath, name), name, stats, ancestors);
    if (child) {
      node->children.insert_or_assign(std::move(name), std::move(child));
    }
  }
  ancestors.pop_back();
  if (ec) {
    log::warn("Failed to iterate over directory '{}': {}", absolutePath.string(), ec.message());
  }

  classifyDirectory(*node);
  node->finalize();
  ++stats.nbDirectories;
  return node;
}

void RouteScanner::classifyDirectory(RouteNode& dirNode) const {
  const RouteNode* bestIndex = nullptr;
  std::size_t bestRank = 0;
  // children are iterated by name, so among candidates of equal rank the smallest name wins
  for (const auto& [segment, child] : dirNode.children) {
    if (child->descriptor.isDirectory() || !_config.isIndexFileName(segment)) {
      continue;
    }
    const std::size_t rank = _config.indexCandidateRank(segment);
    if (bestIndex == nullptr || rank < bestRank) {
      bestIndex = child.get();
      bestRank = rank;
    }
  }

  RouteDescriptor& descriptor = dirNode.descriptor;
  if (bestIndex != nullptr) {
    descriptor.kind = RouteKind::DirectoryIndex;
    descriptor.targetKind = bestIndex->descriptor.kind;
    descriptor.absoluteFilePath = bestIndex->descriptor.absoluteFilePath;
    descriptor.lastModified = bestIndex->descriptor.lastModified;
    descriptor.fileSize = bestIndex->descriptor.fileSize;
  } else {
    descriptor.kind = RouteKind::Directory;
    descriptor.targetKind = RouteKind::Directory;
    descriptor.absoluteFilePath = absolutePathOf(descriptor.normalizedPath);
    std::error_code ec;
    descriptor.lastModified = LastWriteTime(descriptor.absoluteFilePath, ec);
    descriptor.fileSize = 0;
  }
}

}  // namespace fsroute
