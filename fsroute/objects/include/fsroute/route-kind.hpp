#pragma once

#include <cstdint>
#include <string_view>

namespace fsroute {

// Handling strategy of an indexed entry, decided by naming conventions at scan time.
enum class RouteKind : uint8_t {
  Static,          // served verbatim
  Template,        // rendered by the template collaborator
  Dynamic,         // executed by the script collaborator
  DirectoryIndex,  // directory owning an index file, dispatched as the kind of that file
  Directory        // plain directory, only reachable through the directory listing fallback
};

constexpr std::string_view RouteKindName(RouteKind kind) noexcept {
  switch (kind) {
    case RouteKind::Static:
      return "static";
    case RouteKind::Template:
      return "template";
    case RouteKind::Dynamic:
      return "dynamic";
    case RouteKind::DirectoryIndex:
      return "directory-index";
    case RouteKind::Directory:
      return "directory";
    default:
      return "unknown";
  }
}

constexpr bool IsDirectoryKind(RouteKind kind) noexcept {
  return kind == RouteKind::DirectoryIndex || kind == RouteKind::Directory;
}

}  // namespace fsroute
