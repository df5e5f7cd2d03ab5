#pragma once

#include <cstdint>
#include <string_view>

#include "fsroute/collaborators.hpp"
#include "fsroute/http-method.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/request-context.hpp"
#include "fsroute/resolver.hpp"
#include "fsroute/response-descriptor.hpp"
#include "fsroute/route-config.hpp"

namespace fsroute {

enum class DispatchError : std::uint8_t { None, TemplateError, DynamicExecutionError, Cancelled };

constexpr std::string_view DispatchErrorName(DispatchError error) noexcept {
  switch (error) {
    case DispatchError::None:
      return "none";
    case DispatchError::TemplateError:
      return "template-error";
    case DispatchError::DynamicExecutionError:
      return "dynamic-execution-error";
    case DispatchError::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

// The response is always usable: errors carry a 500 (503 without body when cancelled), misses discovered at
// dispatch time (method not allowed, file vanished since the scan) carry their 4xx.
struct DispatchResult {
  [[nodiscard]] bool ok() const noexcept { return error == DispatchError::None && miss == MissReason::None; }

  ResponseDescriptor response;
  DispatchError error{DispatchError::None};
  MissReason miss{MissReason::None};
};

// Selects the handling strategy of a resolved route and builds its response:
//  - Static: file slice with validators (ETag, Last-Modified), conditional requests and single byte ranges
//  - Template: body rendered by the template collaborator from request derived data
//  - Dynamic: response produced by the script collaborator, with session pass-through
//  - listing: HTML generated from the in-memory directory children
// Directory indexes are dispatched according to the kind of their index file.
class Dispatcher {
 public:
  Dispatcher(RouteConfig config, Collaborators collaborators);

  [[nodiscard]] DispatchResult dispatch(const ResolvedRoute& route, const RequestContext& request) const;

  [[nodiscard]] const RouteConfig& config() const noexcept { return _config; }

  [[nodiscard]] const Collaborators& collaborators() const noexcept { return _collaborators; }

 private:
  [[nodiscard]] DispatchResult serveStatic(const ResolvedRoute& route, const RequestContext& request) const;

  [[nodiscard]] DispatchResult renderTemplate(const ResolvedRoute& route, const RequestContext& request) const;

  [[nodiscard]] DispatchResult executeScript(const ResolvedRoute& route, const RequestContext& request) const;

  [[nodiscard]] DispatchResult renderListing(const ResolvedRoute& route, const RequestContext& request) const;

  RouteConfig _config;
  Collaborators _collaborators;
};

// Response of a miss: 404, 403, or 405 with an Allow header listing 'allowedMethods'.
[[nodiscard]] ResponseDescriptor MakeMissResponse(MissReason miss, http::MethodBmp allowedMethods = http::kReadOnlyMethods);

// Data passed to templates: request.method, request.path, request.query, route.path, route.file, and one
// query.<name> per decoded query parameter (first occurrence wins).
[[nodiscard]] TemplateContext MakeTemplateContext(const ResolvedRoute& route, const RequestContext& request);

}  // namespace fsroute
