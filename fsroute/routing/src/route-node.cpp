#include "fsroute/route-node.hpp"

#include <algorithm>

namespace fsroute {

void RouteNode::finalize() noexcept {
  descriptor.childCount = children.size();
  _subtreeSize = 1;
  for (const auto& [segment, child] : children) {
    _subtreeSize += child->subtreeSize();
  }
}

bool SameRouteSubtree(const RouteNode& lhs, const RouteNode& rhs) {
  if (&lhs == &rhs) {
    return true;
  }
  if (lhs.forbidden != rhs.forbidden || lhs.descriptor != rhs.descriptor ||
      lhs.children.size() != rhs.children.size()) {
    return false;
  }
  return std::ranges::equal(lhs.children, rhs.children, [](const auto& lhsChild, const auto& rhsChild) {
    return lhsChild.first == rhsChild.first && SameRouteSubtree(*lhsChild.second, *rhsChild.second);
  });
}

}  // namespace fsroute
