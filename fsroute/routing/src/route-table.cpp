#include "fsroute/route-table.hpp"

#include <functional>
#include <string_view>

namespace fsroute {

namespace {

void Visit(const RouteNode& node, const std::function<void(const RouteDescriptor&)>& callback) {
  callback(node.descriptor);
  for (const auto& [segment, child] : node.children) {
    Visit(*child, callback);
  }
}

}  // namespace

RouteTable::FindResult RouteTable::find(std::string_view normalizedPath) const noexcept {
  const RouteNode* node = _root.get();
  if (node == nullptr) {
    return {};
  }
  while (!normalizedPath.empty()) {
    if (node->forbidden) {
      return {nullptr, MissReason::Forbidden};
    }
    const auto slashPos = normalizedPath.find('/');
    const std::string_view segment = normalizedPath.substr(0, slashPos);
    const auto it = node->children.find(segment);
    if (it == node->children.end()) {
      return {};
    }
    node = it->second.get();
    if (slashPos == std::string_view::npos) {
      break;
    }
    normalizedPath.remove_prefix(slashPos + 1);
  }
  if (node->forbidden) {
    return {nullptr, MissReason::Forbidden};
  }
  return {node, MissReason::None};
}

void RouteTable::forEach(const std::function<void(const RouteDescriptor&)>& callback) const {
  if (_root) {
    Visit(*_root, callback);
  }
}

}  // namespace fsroute
