#pragma once

#include <string>
#include <string_view>

#include "fsroute/miss.hpp"

namespace fsroute {

// Request target split into its raw path and raw query parts. The fragment, if any, is dropped.
struct RequestTarget {
  std::string_view path;
  std::string_view query;  // without the leading '?'
};

[[nodiscard]] RequestTarget SplitRequestTarget(std::string_view target) noexcept;

struct NormalizedPath {
  [[nodiscard]] bool ok() const noexcept { return miss == MissReason::None; }

  bool operator==(const NormalizedPath&) const = default;

  // Decoded, slash separated, no leading nor trailing slash, no empty, '.' or '..' segment. Empty for the root.
  std::string relative;
  MissReason miss{MissReason::None};
  // Whether the raw path ended with '/' (a directory was requested).
  bool trailingSlash{false};
};

// Canonicalize a raw (percent-encoded) URL path into a path relative to the content root.
// Pure function. Returns Forbidden (and an empty relative path) for:
//  - any '..' segment, before or after decoding (never silently dropped)
//  - invalid percent-encoding
//  - null bytes, control characters and backslashes
//  - a decoded '%' (double encoding)
// Re-normalizing an accepted result yields the same relative path.
[[nodiscard]] NormalizedPath NormalizePath(std::string_view rawPath);

}  // namespace fsroute
