#include "fsroute/resolver.hpp"

#include <string>
#include <string_view>

#include "fsroute/http-method.hpp"
#include "fsroute/log.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/path-normalizer.hpp"
#include "fsroute/route-kind.hpp"
#include "fsroute/route-table.hpp"

namespace fsroute {

namespace {

bool LastSegmentHasExtension(std::string_view relative) noexcept {
  const auto lastSegment = relative.substr(relative.rfind('/') + 1U);
  const auto dotPos = lastSegment.rfind('.');
  return dotPos != std::string_view::npos && dotPos != 0;
}

ResolveResult Hit(const RouteTablePtr& table, const RouteNode* node, std::string_view query) {
  ResolveResult result;
  result.route.node = PinNode(table, node);
  result.route.queryRemainder.assign(query);
  return result;
}

ResolveResult Miss(MissReason miss) {
  ResolveResult result;
  result.miss = miss;
  return result;
}

}  // namespace

http::MethodBmp ResolvedRoute::allowedMethods() const noexcept {
  if (isListing) {
    return http::kReadOnlyMethods;
  }
  return dispatchKind() == RouteKind::Dynamic ? http::kDynamicMethods : http::kReadOnlyMethods;
}

ResolveResult Resolver::resolve(const NormalizedPath& path, std::string_view query) const {
  if (!path.ok()) {
    return Miss(path.miss);
  }
  const RouteTablePtr table = _index.snapshot();
  if (!table) {
    return Miss(MissReason::NotFound);
  }

  const auto direct = table->find(path.relative);
  if (direct.miss == MissReason::Forbidden) {
    return Miss(MissReason::Forbidden);
  }
  const RouteNode* directNode = direct.node;
  if (directNode != nullptr) {
    switch (directNode->descriptor.kind) {
      case RouteKind::Static:
      case RouteKind::Template:
      case RouteKind::Dynamic:
        if (path.trailingSlash) {
          return Miss(MissReason::NotFound);
        }
        return Hit(table, directNode, query);
      case RouteKind::DirectoryIndex:
        return Hit(table, directNode, query);
      case RouteKind::Directory:
        break;
    }
  }

  if (!path.trailingSlash && !path.relative.empty() && !LastSegmentHasExtension(path.relative)) {
    std::string candidate = path.relative;
    const auto baseSize = candidate.size();
    for (const std::string& extension : _index.config().extensionPriority) {
      candidate.resize(baseSize);
      candidate.append(extension);
      const auto inferred = table->find(candidate);
      if (inferred.node != nullptr && !inferred.node->descriptor.isDirectory()) {
        auto result = Hit(table, inferred.node, query);
        result.route.matchedSuffix = extension;
        return result;
      }
    }
  }

  if (directNode != nullptr && _index.config().enableDirectoryListing) {
    auto result = Hit(table, directNode, query);
    result.route.isListing = true;
    return result;
  }
  return Miss(MissReason::NotFound);
}

ResolveResult Resolver::resolveTarget(std::string_view target) const {
  const RequestTarget split = SplitRequestTarget(target);
  auto result = resolve(NormalizePath(split.path), split.query);
  log::trace("Resolved '{}' -> {}", target, MissReasonName(result.miss));
  return result;
}

}  // namespace fsroute
