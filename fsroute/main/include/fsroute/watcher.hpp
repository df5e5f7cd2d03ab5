#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include "fsroute/event-fd.hpp"
#include "fsroute/event-loop.hpp"
#include "fsroute/flat-hash-map.hpp"
#include "fsroute/inotify-fd.hpp"
#include "fsroute/route-index.hpp"
#include "fsroute/vector.hpp"
#include "fsroute/watcher-config.hpp"

namespace fsroute {

enum class ChangeKind : std::uint8_t { Created, Modified, Deleted };

constexpr std::string_view ChangeKindName(ChangeKind kind) noexcept {
  switch (kind) {
    case ChangeKind::Created:
      return "created";
    case ChangeKind::Modified:
      return "modified";
    case ChangeKind::Deleted:
      return "deleted";
    default:
      return "unknown";
  }
}

// Kind of change reported by an inotify event mask. Moves are a deletion (source) and a creation (destination).
[[nodiscard]] ChangeKind ChangeKindFromMask(std::uint32_t mask) noexcept;

// Distinct paths of a batch of changes, dropping the ones lying below another changed path of the batch.
// "" (the content root) absorbs everything. The result is sorted.
[[nodiscard]] vector<std::string> CoalesceChangedPaths(vector<std::string> paths);

// Keeps a RouteIndex in sync with its content tree, best effort, from a background thread.
// Every indexed directory is watched with inotify, and directories created later are watched as they appear.
// The changes of one batch of events are coalesced, then each changed path is refreshed in the index.
// A kernel queue overflow, and the optional periodic rescan, trigger a full refresh.
class Watcher {
 public:
  // Throws std::system_error if the inotify or epoll instances cannot be created.
  Watcher(RouteIndex& index, WatcherConfig config);

  Watcher(const Watcher&) = delete;
  Watcher(Watcher&&) = delete;
  Watcher& operator=(const Watcher&) = delete;
  Watcher& operator=(Watcher&&) = delete;

  ~Watcher() { stop(); }

  // Watches the directories of the current index snapshot and launches the watcher thread.
  // Throws std::logic_error if already started.
  void start();

  // Prompt: the thread blocked in poll is woken up through an eventfd.
  void stop() noexcept;

  [[nodiscard]] bool running() const noexcept { return _thread.joinable(); }

  // Number of directories currently watched.
  [[nodiscard]] std::size_t nbWatchedDirectories() const noexcept {
    return _nbWatchedDirectories.load(std::memory_order_relaxed);
  }

  // Number of index refreshes triggered so far (including full ones).
  [[nodiscard]] std::uint64_t nbRefreshes() const noexcept { return _nbRefreshes.load(std::memory_order_relaxed); }

  // Rethrows the exception that terminated the watcher thread, if any. Call after stop().
  void rethrowIfError();

 private:
  struct PendingChange {
    std::string path;
    bool newDirectory{false};
  };

  void run(const std::stop_token& stopToken);

  void processEvents();

  void refreshAll();

  void refreshPath(const std::string& normalizedPath);

  // Watches every indexed directory at or below 'normalizedPath' in the current snapshot.
  void watchIndexedDirectories(std::string_view normalizedPath);

  void watchDirectory(const std::string& normalizedPath);

  // Drops the watches of 'normalizedPath' and of every directory below it.
  void unwatchDirectories(std::string_view normalizedPath);

  RouteIndex& _index;
  WatcherConfig _config;
  InotifyFd _inotifyFd;
  EventFd _wakeupFd;
  EventLoop _eventLoop;
  flat_hash_map<int, std::string> _watchedPaths;  // watch descriptor -> directory key
  vector<PendingChange> _pendingChanges;
  std::atomic<std::size_t> _nbWatchedDirectories{0};
  std::atomic<std::uint64_t> _nbRefreshes{0};
  std::exception_ptr _error;
  std::jthread _thread;
};

}  // namespace fsroute
