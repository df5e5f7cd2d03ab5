#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "fsroute/route-kind.hpp"
#include "fsroute/timedef.hpp"

namespace fsroute {

// Metadata of one indexed entry. Holds paths only, never an open handle.
struct RouteDescriptor {
  [[nodiscard]] bool isDirectory() const noexcept { return IsDirectoryKind(kind); }

  bool operator==(const RouteDescriptor&) const = default;

  // Canonical slash separated key relative to the content root, without leading slash ("" for the root).
  std::string normalizedPath;

  // File to serve. For a DirectoryIndex, the index file. For a plain Directory, the directory itself.
  std::filesystem::path absoluteFilePath;

  RouteKind kind{RouteKind::Static};

  // Kind of the served file: equal to 'kind' for files, the index file kind for a DirectoryIndex.
  RouteKind targetKind{RouteKind::Static};

  // Modification time of the served file.
  SysTimePoint lastModified;

  // Size in bytes of the served file (0 for a plain Directory).
  std::uint64_t fileSize{0};

  // Number of indexed children (directories only).
  std::size_t childCount{0};
};

}  // namespace fsroute
