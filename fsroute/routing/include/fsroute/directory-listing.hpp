#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "fsroute/route-config.hpp"
#include "fsroute/route-node.hpp"

namespace fsroute {

struct DirectoryListing {
  std::string html;
  std::size_t nbEntries{0};
  bool truncated{false};
};

// HTML listing of a directory node, built from the in-memory children only (never reads the disk).
// Directories come first, then files, each group sorted by name. Unreadable directories are not listed.
// Names are HTML-escaped and links are absolute, URL-encoded paths.
[[nodiscard]] DirectoryListing RenderDirectoryListing(const RouteNode& directory, const RouteConfig& config);

// Human readable size with binary units: "512 B", "1.5 KB", "12 MB".
void AppendFormattedSize(std::uint64_t size, std::string& out);

}  // namespace fsroute
