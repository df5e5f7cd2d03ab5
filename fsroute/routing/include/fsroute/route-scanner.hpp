#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>

#include "fsroute/route-config.hpp"
#include "fsroute/route-node.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

struct ScanStats {
  ScanStats& operator+=(const ScanStats& other) noexcept {
    nbFiles += other.nbFiles;
    nbDirectories += other.nbDirectories;
    nbSkipped += other.nbSkipped;
    nbForbidden += other.nbForbidden;
    return *this;
  }

  std::size_t nbFiles{0};
  std::size_t nbDirectories{0};
  std::size_t nbSkipped{0};
  std::size_t nbForbidden{0};
};

// Reads the content tree from disk and classifies its entries into route nodes.
// Produced nodes are not yet published: callers may still modify them before sharing them.
class RouteScanner {
 public:
  RouteScanner(const RouteConfig& config, const std::filesystem::path& rootPath) noexcept
      : _config(config), _rootPath(rootPath) {}

  // Whether an entry named 'name' may be indexed, regardless of its type.
  [[nodiscard]] bool isIndexableName(std::string_view name) const noexcept;

  // Full recursive scan of the content root.
  // Throws IndexBuildError if the root does not exist, is not a directory or cannot be read.
  [[nodiscard]] std::shared_ptr<RouteNode> scanRoot(ScanStats& stats) const;

  // Scan the entry (file or directory subtree) of key 'normalizedPath'.
  // Returns nullptr if it does not exist anymore or must not be indexed.
  [[nodiscard]] std::shared_ptr<RouteNode> scanEntry(const std::string& normalizedPath, ScanStats& stats) const;

  // Recompute kind, target and metadata of a directory node from its current children.
  void classifyDirectory(RouteNode& dirNode) const;

  [[nodiscard]] std::filesystem::path absolutePathOf(std::string_view normalizedPath) const;

 private:
  using DirId = std::pair<dev_t, ino_t>;

  std::shared_ptr<RouteNode> scanEntryImpl(const std::filesystem::path& absolutePath, std::string normalizedPath,
                                           std::string_view name, ScanStats& stats, vector<DirId>& ancestors) const;

  std::shared_ptr<RouteNode> scanDirectory(const std::filesystem::path& absolutePath, std::string normalizedPath,
                                           ScanStats& stats, vector<DirId>& ancestors) const;

  std::shared_ptr<RouteNode> scanFile(const std::filesystem::path& absolutePath, std::string normalizedPath,
                                      std::string_view name, ScanStats& stats) const;

  const RouteConfig& _config;
  const std::filesystem::path& _rootPath;
};

// Key of the entry 'name' inside the directory of key 'parent'.
[[nodiscard]] std::string JoinRouteKey(std::string_view parent, std::string_view name);

}  // namespace fsroute
