#include "fsroute/watcher.hpp"

#include <sys/inotify.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "fsroute/event-loop.hpp"
#include "fsroute/inotify-fd.hpp"
#include "fsroute/log.hpp"
#include "fsroute/route-node.hpp"
#include "fsroute/route-scanner.hpp"
#include "fsroute/timedef.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

namespace {

// Whether 'path' is 'ancestor' or lies below it.
bool IsSameOrBelow(std::string_view path, std::string_view ancestor) noexcept {
  if (ancestor.empty()) {
    return true;
  }
  return path.starts_with(ancestor) && (path.size() == ancestor.size() || path[ancestor.size()] == '/');
}

}  // namespace

ChangeKind ChangeKindFromMask(std::uint32_t mask) noexcept {
  if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
    return ChangeKind::Created;
  }
  if ((mask & (IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF | IN_MOVE_SELF)) != 0) {
    return ChangeKind::Deleted;
  }
  return ChangeKind::Modified;
}

vector<std::string> CoalesceChangedPaths(vector<std::string> paths) {
  // ancestors are shorter than their descendants
  std::ranges::sort(paths, [](const std::string& lhs, const std::string& rhs) {
    return lhs.size() < rhs.size() || (lhs.size() == rhs.size() && lhs < rhs);
  });

  vector<std::string> coalesced;
  for (std::string& path : paths) {
    const bool covered = std::ranges::any_of(
        coalesced, [&path](const std::string& kept) { return IsSameOrBelow(path, kept); });
    if (!covered) {
      coalesced.push_back(std::move(path));
    }
  }
  std::ranges::sort(coalesced);
  return coalesced;
}

Watcher::Watcher(RouteIndex& index, WatcherConfig config)
    : _index(index), _config(std::move(config)), _eventLoop(_config.pollTimeout) {
  _config.validate();
  _eventLoop.addOrThrow(_inotifyFd.fd(), EventIn);
  _eventLoop.addOrThrow(_wakeupFd.fd(), EventIn);
}

void Watcher::start() {
  if (_thread.joinable()) {
    throw std::logic_error("Watcher already started");
  }
  watchIndexedDirectories("");
  log::info("Watching {} directories of '{}'", _watchedPaths.size(), _index.rootPath().string());

  _thread = std::jthread([this](const std::stop_token& stopToken) {
    try {
      run(stopToken);
    } catch (const std::exception& ex) {
      log::error("Watcher of '{}' terminated: {}", _index.rootPath().string(), ex.what());
      _error = std::current_exception();
    }
  });
}

void Watcher::stop() noexcept {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
    log::info("Watcher of '{}' stopped", _index.rootPath().string());
  }
}

void Watcher::rethrowIfError() {
  if (_error) {
    std::rethrow_exception(std::exchange(_error, nullptr));
  }
}

void Watcher::run(const std::stop_token& stopToken) {
  const std::stop_callback wakeupOnStop(stopToken, [this] { _wakeupFd.send(); });

  const bool periodicRescan = _config.rescanInterval.count() > 0;
  auto nextRescan = SteadyClock::now() + _config.rescanInterval;
  while (!stopToken.stop_requested()) {
    const auto events = _eventLoop.poll();
    if (events.data() == nullptr) {
      throw std::runtime_error("Watcher event loop failure");
    }
    for (const EventLoop::Event& event : events) {
      if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.read();
      } else if (event.fd == _inotifyFd.fd()) {
        processEvents();
      }
    }
    if (periodicRescan && SteadyClock::now() >= nextRescan) {
      log::debug("Periodic rescan of '{}'", _index.rootPath().string());
      refreshAll();
      nextRescan = SteadyClock::now() + _config.rescanInterval;
    }
  }
}

void Watcher::processEvents() {
  bool overflow = false;
  _pendingChanges.clear();
  _inotifyFd.readEvents([this, &overflow](const InotifyEvent& event) {
    if ((event.mask & IN_Q_OVERFLOW) != 0) {
      overflow = true;
      return;
    }
    if ((event.mask & IN_IGNORED) != 0) {
      _watchedPaths.erase(event.watchDescriptor);
      _nbWatchedDirectories.store(_watchedPaths.size(), std::memory_order_relaxed);
      return;
    }
    const auto it = _watchedPaths.find(event.watchDescriptor);
    if (it == _watchedPaths.end()) {
      return;
    }
    if (event.name.empty()) {
      // event on the watched directory itself
      _pendingChanges.push_back(PendingChange{it->second, false});
      return;
    }

    std::string path = JoinRouteKey(it->second, event.name);
    const ChangeKind kind = ChangeKindFromMask(event.mask);
    const bool isDirectory = (event.mask & IN_ISDIR) != 0;
    log::trace("'{}' {}", path, ChangeKindName(kind));
    if (isDirectory && kind == ChangeKind::Deleted) {
      // a moved directory keeps its watches, which would report events under its old path
      unwatchDirectories(path);
    }
    _pendingChanges.push_back(PendingChange{std::move(path), isDirectory && kind == ChangeKind::Created});
  });

  if (overflow) {
    log::warn("inotify queue overflow, rescanning '{}'", _index.rootPath().string());
    refreshAll();
    return;
  }
  if (_pendingChanges.empty()) {
    return;
  }

  // Watch new directories before scanning them, so that entries created in the meantime are not missed.
  const RouteScanner scanner(_index.config(), _index.rootPath());
  vector<std::string> changedPaths;
  changedPaths.reserve(_pendingChanges.size());
  for (PendingChange& change : _pendingChanges) {
    if (change.newDirectory && scanner.isIndexableName(change.path.substr(change.path.rfind('/') + 1U))) {
      watchDirectory(change.path);
    }
    changedPaths.push_back(std::move(change.path));
  }

  for (const std::string& path : CoalesceChangedPaths(std::move(changedPaths))) {
    if (path.empty()) {
      refreshAll();
    } else {
      refreshPath(path);
    }
  }
}

void Watcher::refreshAll() {
  _index.refresh("");
  _nbRefreshes.fetch_add(1, std::memory_order_relaxed);
  watchIndexedDirectories("");
}

void Watcher::refreshPath(const std::string& normalizedPath) {
  if (_index.refresh(normalizedPath)) {
    log::debug("Index refreshed for '{}' (version {})", normalizedPath, _index.version());
  }
  _nbRefreshes.fetch_add(1, std::memory_order_relaxed);
  watchIndexedDirectories(normalizedPath);
}

void Watcher::watchIndexedDirectories(std::string_view normalizedPath) {
  const RouteLookup lookup = _index.lookup(normalizedPath);
  if (!lookup.found()) {
    return;
  }
  vector<const RouteNode*> toVisit{lookup.node.get()};
  while (!toVisit.empty()) {
    const RouteNode* node = toVisit.back();
    toVisit.pop_back();
    if (!node->descriptor.isDirectory() || node->forbidden) {
      continue;
    }
    watchDirectory(node->descriptor.normalizedPath);
    for (const auto& [segment, child] : node->children) {
      toVisit.push_back(child.get());
    }
  }
}

void Watcher::watchDirectory(const std::string& normalizedPath) {
  const auto absolutePath = normalizedPath.empty() ? _index.rootPath() : _index.rootPath() / normalizedPath;
  const int wd = _inotifyFd.addWatch(absolutePath.c_str());
  if (wd == -1) {
    return;
  }
  _watchedPaths[wd] = normalizedPath;
  _nbWatchedDirectories.store(_watchedPaths.size(), std::memory_order_relaxed);
}

void Watcher::unwatchDirectories(std::string_view normalizedPath) {
  // erasing may relocate entries of the open-addressing table, so collect first
  vector<int> staleWatches;
  for (const auto& [wd, path] : _watchedPaths) {
    if (IsSameOrBelow(path, normalizedPath)) {
      staleWatches.push_back(wd);
    }
  }
  for (const int wd : staleWatches) {
    _inotifyFd.removeWatch(wd);
    _watchedPaths.erase(wd);
  }
  _nbWatchedDirectories.store(_watchedPaths.size(), std::memory_order_relaxed);
}

}  // namespace fsroute
