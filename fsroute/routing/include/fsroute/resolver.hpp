#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "fsroute/http-method.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/path-normalizer.hpp"
#include "fsroute/route-config.hpp"
#include "fsroute/route-descriptor.hpp"
#include "fsroute/route-index.hpp"
#include "fsroute/route-node.hpp"

namespace fsroute {

// Outcome of a successful resolution. Built per request and never cached.
struct ResolvedRoute {
  [[nodiscard]] const RouteDescriptor& descriptor() const noexcept { return node->descriptor; }

  // Kind used for dispatch: the index file kind for directory indexes.
  [[nodiscard]] RouteKind dispatchKind() const noexcept { return node->descriptor.targetKind; }

  // Methods accepted by this route.
  [[nodiscard]] http::MethodBmp allowedMethods() const noexcept;

  // Matched node. Pins the snapshot it belongs to: a concurrent refresh never invalidates it.
  RouteNodePtr node;
  // Extension appended by extension inference (e.g. ".tmpl"), empty for a direct match.
  std::string matchedSuffix;
  // Raw query string of the request, without the '?'.
  std::string queryRemainder;
  // Synthetic directory listing of a plain directory.
  bool isListing{false};
};

struct ResolveResult {
  [[nodiscard]] bool ok() const noexcept { return miss == MissReason::None; }

  ResolvedRoute route;
  MissReason miss{MissReason::None};
};

// Maps normalized paths to routes, applying the fallback rules:
//  1. direct lookup: a file, or a directory owning an index file
//     (a request with a trailing slash never matches a file)
//  2. extension inference, for a last segment without extension and without trailing slash: each extension of
//     the priority list is appended in turn, the first existing file wins
//  3. plain directory: synthetic listing if enabled
//  4. NotFound
// Walking into an unreadable directory is Forbidden. All steps of one resolution use the same snapshot.
class Resolver {
 public:
  explicit Resolver(RouteConfig config) : _index(std::move(config)) {}

  [[nodiscard]] ResolveResult resolve(const NormalizedPath& path, std::string_view query = {}) const;

  // Convenience for a raw request target (path + optional query).
  [[nodiscard]] ResolveResult resolveTarget(std::string_view target) const;

  [[nodiscard]] RouteIndex& index() noexcept { return _index; }
  [[nodiscard]] const RouteIndex& index() const noexcept { return _index; }

 private:
  RouteIndex _index;
};

}  // namespace fsroute
