#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "fsroute/miss.hpp"
#include "fsroute/route-config.hpp"
#include "fsroute/route-descriptor.hpp"
#include "fsroute/route-node.hpp"
#include "fsroute/route-table.hpp"

namespace fsroute {

struct RouteLookup {
  [[nodiscard]] bool found() const noexcept { return node != nullptr; }

  // Precondition: found()
  [[nodiscard]] const RouteDescriptor& descriptor() const noexcept { return node->descriptor; }

  RouteNodePtr node;  // pins the snapshot it was found in
  MissReason miss{MissReason::NotFound};
};

// In-memory mirror of the content tree, mapping normalized paths to route descriptors.
//
// Readers never lock: they load the current snapshot (one atomic shared_ptr load) and walk it.
// Writers (buildFull, refresh) are serialized by a mutex, build the new version off to the side, sharing all
// untouched subtrees with the previous version, and publish it with a single atomic store.
// Readers therefore see either the fully old or the fully new version, never a mix.
class RouteIndex {
 public:
  // Validates the configuration (std::invalid_argument). Does not scan: call buildFull().
  explicit RouteIndex(RouteConfig config);

  RouteIndex(const RouteIndex&) = delete;
  RouteIndex(RouteIndex&&) = delete;
  RouteIndex& operator=(const RouteIndex&) = delete;
  RouteIndex& operator=(RouteIndex&&) = delete;

  ~RouteIndex() = default;

  // Blocking full scan of the content root, then publication.
  // Throws IndexBuildError if the root is missing, not a directory or unreadable.
  void buildFull();

  // Re-scan the entry at 'normalizedPath' (file or directory subtree) and atomically replace that slice of the
  // index, reclassifying its parent directory. Removes the entry if it vanished. If the parent is not indexed,
  // the nearest indexed ancestor slice is rescanned instead. "" rescans everything.
  // Never throws: on failure, logs and keeps the current snapshot. Returns true if a new snapshot was published.
  bool refresh(std::string_view normalizedPath);

  // O(depth) lookup in the current snapshot, never touches the disk.
  [[nodiscard]] RouteLookup lookup(std::string_view normalizedPath) const;

  // Iterates the descriptors of the current snapshot in path order.
  void forEach(const std::function<void(const RouteDescriptor&)>& callback) const;

  // Current snapshot, nullptr before the first successful build.
  [[nodiscard]] RouteTablePtr snapshot() const noexcept { return _snapshot.load(std::memory_order_acquire); }

  // Version of the current snapshot (0 before the first build).
  [[nodiscard]] uint64_t version() const noexcept;

  [[nodiscard]] const RouteConfig& config() const noexcept { return _config; }

  // Absolute path of the content root.
  [[nodiscard]] const std::filesystem::path& rootPath() const noexcept { return _rootPath; }

 private:
  bool rebuildAll();

  bool refreshEntry(const RouteTablePtr& current, std::string_view normalizedPath);

  void publish(RouteNodePtr root, const RouteTablePtr& current);

  RouteConfig _config;
  std::filesystem::path _rootPath;
  std::atomic<RouteTablePtr> _snapshot;
  std::mutex _refreshMutex;
};

}  // namespace fsroute
