#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "fsroute/collaborators.hpp"
#include "fsroute/dispatcher.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/request-context.hpp"
#include "fsroute/resolver.hpp"
#include "fsroute/response-descriptor.hpp"
#include "fsroute/route-config.hpp"
#include "fsroute/route-index.hpp"
#include "fsroute/watcher-config.hpp"
#include "fsroute/watcher.hpp"

namespace fsroute {

// Stages of one request through the router. No stage is ever retried.
enum class RequestState : std::uint8_t { Received, Normalized, Resolved, Dispatched, Responded, Errored };

constexpr std::string_view RequestStateName(RequestState state) noexcept {
  switch (state) {
    case RequestState::Received:
      return "received";
    case RequestState::Normalized:
      return "normalized";
    case RequestState::Resolved:
      return "resolved";
    case RequestState::Dispatched:
      return "dispatched";
    case RequestState::Responded:
      return "responded";
    case RequestState::Errored:
      return "errored";
    default:
      return "unknown";
  }
}

// Final state of a handled request. 'response' is always ready to be written, misses and errors included.
struct RouterOutcome {
  ResponseDescriptor response;
  RequestState state{RequestState::Received};
  MissReason miss{MissReason::None};
  DispatchError error{DispatchError::None};
};

// Facade wiring the whole pipeline: normalization, resolution, dispatch, and the optional watcher keeping the
// index in sync with the content tree.
// handle() is thread safe and may be called concurrently with index refreshes.
class FileRouter {
 public:
  // Scans the content root synchronously. Throws std::invalid_argument on invalid configuration and
  // IndexBuildError if the content root cannot be indexed.
  // A watcher that cannot be set up is logged and skipped: the router then serves its startup snapshot.
  explicit FileRouter(RouteConfig config, Collaborators collaborators = {}, WatcherConfig watcherConfig = {});

  FileRouter(const FileRouter&) = delete;
  FileRouter(FileRouter&&) = delete;
  FileRouter& operator=(const FileRouter&) = delete;
  FileRouter& operator=(FileRouter&&) = delete;

  ~FileRouter();

  [[nodiscard]] RouterOutcome handle(const RequestContext& request) const;

  // Resolution only, for a raw request target.
  [[nodiscard]] ResolveResult resolve(std::string_view target) const { return _resolver.resolveTarget(target); }

  // Manual refresh of the entry at 'normalizedPath' ("" for everything). See RouteIndex::refresh.
  bool refresh(std::string_view normalizedPath) { return _resolver.index().refresh(normalizedPath); }

  [[nodiscard]] bool watching() const noexcept { return _watcher && _watcher->running(); }

  [[nodiscard]] const RouteIndex& index() const noexcept { return _resolver.index(); }

  // nullptr if the watcher is disabled or could not be started.
  [[nodiscard]] const Watcher* watcher() const noexcept { return _watcher.get(); }

 private:
  Resolver _resolver;
  Dispatcher _dispatcher;
  std::unique_ptr<Watcher> _watcher;
};

}  // namespace fsroute
