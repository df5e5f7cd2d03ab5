#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "fsroute/miss.hpp"
#include "fsroute/route-descriptor.hpp"
#include "fsroute/route-node.hpp"

namespace fsroute {

// One immutable published version of the route index.
class RouteTable {
 public:
  struct FindResult {
    const RouteNode* node{nullptr};
    MissReason miss{MissReason::NotFound};
  };

  RouteTable(RouteNodePtr root, uint64_t version) noexcept : _root(std::move(root)), _version(version) {}

  // O(depth) walk of 'normalizedPath' ("" is the root). Never touches the disk.
  // Walking into a forbidden directory gives Forbidden, a missing segment gives NotFound.
  [[nodiscard]] FindResult find(std::string_view normalizedPath) const noexcept;

  // Calls 'callback' for each descriptor, in path order (parents before children, siblings by name).
  // Forbidden directories are visited but not their (unknown) content.
  void forEach(const std::function<void(const RouteDescriptor&)>& callback) const;

  [[nodiscard]] const RouteNodePtr& root() const noexcept { return _root; }

  [[nodiscard]] uint64_t version() const noexcept { return _version; }

  // Number of descriptors of this snapshot.
  [[nodiscard]] std::size_t size() const noexcept { return _root ? _root->subtreeSize() : 0U; }

 private:
  RouteNodePtr _root;
  uint64_t _version;
};

using RouteTablePtr = std::shared_ptr<const RouteTable>;

// Node pointer sharing ownership of its whole snapshot, so that it outlives any later refresh.
[[nodiscard]] inline RouteNodePtr PinNode(const RouteTablePtr& table, const RouteNode* node) noexcept {
  return RouteNodePtr(table, node);
}

}  // namespace fsroute
