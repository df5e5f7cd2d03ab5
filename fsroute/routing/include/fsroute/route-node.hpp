#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "fsroute/route-descriptor.hpp"

namespace fsroute {

struct RouteNode;

// Nodes are immutable once published: snapshots share unchanged subtrees.
using RouteNodePtr = std::shared_ptr<const RouteNode>;

// Children of a directory node, keyed and ordered by path segment.
using RouteChildren = std::map<std::string, RouteNodePtr, std::less<>>;

struct RouteNode {
  // Number of nodes of this subtree, this one included.
  [[nodiscard]] std::size_t subtreeSize() const noexcept { return _subtreeSize; }

  // Recompute childCount and the subtree size from 'children'. Called once before publication.
  void finalize() noexcept;

  RouteDescriptor descriptor;
  RouteChildren children;

  // Directory that could not be read: every path at or below it is Forbidden until a successful rescan.
  bool forbidden{false};

 private:
  std::size_t _subtreeSize{1};
};

// Whether both subtrees describe the same entries. Shared child pointers are equal without being walked.
[[nodiscard]] bool SameRouteSubtree(const RouteNode& lhs, const RouteNode& rhs);

}  // namespace fsroute
