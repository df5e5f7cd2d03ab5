#include "fsroute/file-router.hpp"

#include <memory>
#include <system_error>
#include <utility>

#include "fsroute/http-method.hpp"
#include "fsroute/http-status-code.hpp"
#include "fsroute/log.hpp"
#include "fsroute/path-normalizer.hpp"

namespace fsroute {

namespace {

void LogTransition(const RequestContext& request, RequestState state) {
  log::trace("{} {} {}", http::MethodToStr(request.method()), request.target(), RequestStateName(state));
}

}  // namespace

FileRouter::FileRouter(RouteConfig config, Collaborators collaborators, WatcherConfig watcherConfig)
    : _resolver(config), _dispatcher(std::move(config), std::move(collaborators)) {
  watcherConfig.validate();
  _resolver.index().buildFull();

  if (!watcherConfig.enabled) {
    log::debug("File system watcher disabled for '{}'", _resolver.index().rootPath().string());
    return;
  }
  try {
    _watcher = std::make_unique<Watcher>(_resolver.index(), std::move(watcherConfig));
    _watcher->start();
  } catch (const std::system_error& ex) {
    log::error("Unable to watch '{}', serving the startup snapshot only: {}", _resolver.index().rootPath().string(),
               ex.what());
    _watcher.reset();
  }
}

FileRouter::~FileRouter() {
  // the watcher refers to the index, stop it first
  _watcher.reset();
}

RouterOutcome FileRouter::handle(const RequestContext& request) const {
  RouterOutcome outcome;
  LogTransition(request, outcome.state);

  if (request.stopRequested()) {
    outcome.response.status(http::StatusCodeServiceUnavailable);
    outcome.error = DispatchError::Cancelled;
    outcome.state = RequestState::Errored;
    LogTransition(request, outcome.state);
    return outcome;
  }

  const RequestTarget target = SplitRequestTarget(request.target());
  const NormalizedPath normalizedPath = NormalizePath(target.path);
  if (normalizedPath.ok()) {
    outcome.state = RequestState::Normalized;
    LogTransition(request, outcome.state);
  }

  const ResolveResult resolved = _resolver.resolve(normalizedPath, target.query);
  if (!resolved.ok()) {
    outcome.response = MakeMissResponse(resolved.miss);
    outcome.miss = resolved.miss;
    outcome.state = RequestState::Responded;
    LogTransition(request, outcome.state);
    return outcome;
  }
  outcome.state = RequestState::Resolved;
  LogTransition(request, outcome.state);

  DispatchResult dispatched = _dispatcher.dispatch(resolved.route, request);
  outcome.state = RequestState::Dispatched;
  LogTransition(request, outcome.state);

  outcome.response = std::move(dispatched.response);
  outcome.miss = dispatched.miss;
  outcome.error = dispatched.error;
  outcome.state = dispatched.error == DispatchError::None ? RequestState::Responded : RequestState::Errored;
  LogTransition(request, outcome.state);
  return outcome;
}

}  // namespace fsroute
