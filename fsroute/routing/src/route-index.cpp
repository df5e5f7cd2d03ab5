#include "fsroute/route-index.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "fsroute/errors.hpp"
#include "fsroute/log.hpp"
#include "fsroute/path-normalizer.hpp"
#include "fsroute/route-scanner.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

namespace {

std::filesystem::path MakeRootPath(const std::filesystem::path& contentRoot) {
  std::error_code ec;
  auto root = std::filesystem::weakly_canonical(contentRoot, ec);
  if (ec) {
    root = std::filesystem::absolute(contentRoot, ec);
    if (ec) {
      root = contentRoot;
    }
  }
  return root;
}

}  // namespace

RouteIndex::RouteIndex(RouteConfig config) : _config(std::move(config)) {
  _config.validate();
  _rootPath = MakeRootPath(_config.contentRoot);
}

uint64_t RouteIndex::version() const noexcept {
  const auto current = snapshot();
  return current ? current->version() : 0U;
}

void RouteIndex::buildFull() {
  const auto start = std::chrono::steady_clock::now();
  std::scoped_lock lock(_refreshMutex);

  ScanStats stats;
  RouteScanner scanner(_config, _rootPath);
  auto root = scanner.scanRoot(stats);
  publish(std::move(root), snapshot());

  const auto durationMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  log::info(
      "Route index of '{}' built (version {}): {} files, {} directories, {} skipped, {} forbidden subtrees in {} ms",
      _rootPath.string(), version(), stats.nbFiles, stats.nbDirectories, stats.nbSkipped, stats.nbForbidden,
      durationMs);
}

bool RouteIndex::refresh(std::string_view normalizedPath) {
  const NormalizedPath checked = NormalizePath(normalizedPath);
  if (!checked.ok()) {
    log::warn("Ignoring refresh of invalid path '{}'", normalizedPath);
    return false;
  }

  std::scoped_lock lock(_refreshMutex);
  const auto current = snapshot();
  try {
    if (!current || checked.relative.empty()) {
      return rebuildAll();
    }
    return refreshEntry(current, checked.relative);
  } catch (const std::exception& ex) {
    log::error("Refresh of '{}' failed, keeping index version {}: {}", checked.relative,
               current ? current->version() : 0U, ex.what());
  }
  return false;
}

bool RouteIndex::rebuildAll() {
  const auto start = std::chrono::steady_clock::now();
  ScanStats stats;
  RouteScanner scanner(_config, _rootPath);
  std::shared_ptr<RouteNode> root;
  try {
    root = scanner.scanRoot(stats);
  } catch (const IndexBuildError& ex) {
    log::error("Full rescan failed, keeping index version {}: {}", version(), ex.what());
    return false;
  }
  const auto current = snapshot();
  if (current && SameRouteSubtree(*current->root(), *root)) {
    log::debug("Full rescan of '{}': index version {} is up to date", _rootPath.string(), current->version());
    return false;
  }
  publish(std::move(root), current);
  log::debug("Route index fully rescanned (version {}): {} files, {} directories, {} skipped, {} forbidden in {} ms",
             version(), stats.nbFiles, stats.nbDirectories, stats.nbSkipped, stats.nbForbidden,
             std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
  return true;
}

bool RouteIndex::refreshEntry(const RouteTablePtr& current, std::string_view normalizedPath) {
  vector<std::string_view> segments;
  for (std::string_view remaining = normalizedPath; !remaining.empty();) {
    const auto slashPos = remaining.find('/');
    segments.push_back(remaining.substr(0, slashPos));
    if (slashPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slashPos + 1);
  }

  // Descend to the deepest readable indexed directory that is a parent of the refreshed path.
  vector<const RouteNode*> chain;
  chain.push_back(current->root().get());
  while (chain.size() < segments.size()) {
    const RouteNode& parent = *chain.back();
    const auto it = parent.children.find(segments[chain.size() - 1U]);
    if (it == parent.children.end() || !it->second->descriptor.isDirectory() || it->second->forbidden) {
      break;
    }
    chain.push_back(it->second.get());
  }

  const std::size_t depth = chain.size() - 1U;
  const std::string_view entryName = segments[depth];
  const std::string entryKey(normalizedPath.substr(
      0, static_cast<std::size_t>(entryName.data() + entryName.size() - normalizedPath.data())));

  ScanStats stats;
  RouteScanner scanner(_config, _rootPath);
  auto newEntry = scanner.scanEntry(entryKey, stats);

  const RouteNode& oldParent = *chain.back();
  const auto oldIt = oldParent.children.find(entryName);
  if (!newEntry && oldIt == oldParent.children.end()) {
    log::debug("Refresh of '{}': nothing to update", entryKey);
    return false;
  }

  auto newParent = std::make_shared<RouteNode>(oldParent);
  if (newEntry) {
    newParent->children.insert_or_assign(std::string(entryName), std::move(newEntry));
  } else {
    newParent->children.erase(newParent->children.find(entryName));
  }
  scanner.classifyDirectory(*newParent);
  newParent->finalize();
  if (SameRouteSubtree(*newParent, oldParent)) {
    log::debug("Refresh of '{}': index version {} is up to date", entryKey, current->version());
    return false;
  }

  // Path copy of the ancestors, sharing every other subtree with the current snapshot.
  RouteNodePtr child = std::move(newParent);
  for (std::size_t pos = depth; pos-- > 0;) {
    auto copy = std::make_shared<RouteNode>(*chain[pos]);
    copy->children.insert_or_assign(std::string(segments[pos]), std::move(child));
    copy->finalize();
    child = std::move(copy);
  }

  publish(std::move(child), current);
  log::debug("Refreshed '{}' (version {}): {} files, {} directories, {} skipped, {} forbidden", entryKey, version(),
             stats.nbFiles, stats.nbDirectories, stats.nbSkipped, stats.nbForbidden);
  return true;
}

void RouteIndex::publish(RouteNodePtr root, const RouteTablePtr& current) {
  const uint64_t newVersion = current ? current->version() + 1U : 1U;
  _snapshot.store(std::make_shared<const RouteTable>(std::move(root), newVersion), std::memory_order_release);
}

RouteLookup RouteIndex::lookup(std::string_view normalizedPath) const {
  const auto current = snapshot();
  if (!current) {
    return {};
  }
  const auto found = current->find(normalizedPath);
  if (found.node == nullptr) {
    return RouteLookup{nullptr, found.miss};
  }
  return RouteLookup{PinNode(current, found.node), MissReason::None};
}

void RouteIndex::forEach(const std::function<void(const RouteDescriptor&)>& callback) const {
  const auto current = snapshot();
  if (current) {
    current->forEach(callback);
  }
}

}  // namespace fsroute
