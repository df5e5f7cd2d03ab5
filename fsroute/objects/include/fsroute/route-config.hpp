#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "fsroute/http-constants.hpp"
#include "fsroute/route-kind.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

/// Configuration of the file system routing: naming conventions of the content tree and serving knobs.
/// Filesystem conventions (which extension is a template, which file is a directory index, what is hidden)
/// all live here, nothing is hard-coded in the scanner or the resolver.
class RouteConfig {
 public:
  struct ExtensionMapping {
    bool operator==(const ExtensionMapping&) const = default;

    std::string extension;  // with leading dot, e.g. ".tmpl"
    RouteKind kind;         // Template or Dynamic
  };

  // Throws std::invalid_argument on inconsistent configuration.
  void validate() const;

  RouteConfig& withContentRoot(std::filesystem::path root) {
    contentRoot = std::move(root);
    return *this;
  }

  // Map 'extension' to 'kind'. Mapping to Static removes any previous mapping for this extension.
  RouteConfig& withExtensionKind(std::string_view extension, RouteKind kind);

  RouteConfig& withExtensionPriority(std::initializer_list<std::string_view> extensions);

  RouteConfig& withIndexPattern(std::string_view pattern) {
    indexPattern.assign(pattern);
    return *this;
  }

  RouteConfig& withDirectoryListing(bool enable = true) {
    enableDirectoryListing = enable;
    return *this;
  }

  RouteConfig& withShowHiddenFiles(bool enable = true) {
    showHiddenFiles = enable;
    return *this;
  }

  RouteConfig& withSkipUnderscorePrefixed(bool enable = true) {
    skipUnderscorePrefixed = enable;
    return *this;
  }

  RouteConfig& withFollowSymlinks(bool enable = true) {
    followSymlinks = enable;
    return *this;
  }

  RouteConfig& withMaxEntriesToList(std::size_t maxEntries) {
    maxEntriesToList = maxEntries;
    return *this;
  }

  RouteConfig& withDefaultContentType(std::string_view contentType) {
    defaultContentType.assign(contentType);
    return *this;
  }

  RouteConfig& withTemplateContentType(std::string_view contentType) {
    templateContentType.assign(contentType);
    return *this;
  }

  RouteConfig& withSessionCookieName(std::string_view name) {
    sessionCookieName.assign(name);
    return *this;
  }

  // Kind of a file given its extension (with leading dot, case-insensitive). Total: unknown extensions are Static.
  [[nodiscard]] RouteKind kindForExtension(std::string_view extension) const noexcept;

  // Kind of a file given its name, deduced from its last extension.
  [[nodiscard]] RouteKind kindForFileName(std::string_view fileName) const noexcept;

  // Whether 'fileName' matches the index pattern.
  [[nodiscard]] bool isIndexFileName(std::string_view fileName) const noexcept;

  // Rank of 'fileName' among index candidates of a same directory: the position of its extension in the
  // priority list, or the size of the list if absent. Lower is better.
  [[nodiscard]] std::size_t indexCandidateRank(std::string_view fileName) const noexcept;

  // Root of the content tree.
  std::filesystem::path contentRoot{"."};

  // Extension to kind table. Extensions not listed are Static.
  vector<ExtensionMapping> extensionKinds{{".tmpl", RouteKind::Template},
                                          {".jinja", RouteKind::Template},
                                          {".py", RouteKind::Dynamic}};

  // Order in which extensions are tried when a request path without extension misses.
  vector<std::string> extensionPriority{".py", ".tmpl", ".jinja"};

  // Pattern of directory index files: either an exact file name, or a prefix followed by a final '*'.
  std::string indexPattern{"index.*"};

  // Whether a directory without index file is answered by a generated HTML listing.
  bool enableDirectoryListing{false};

  // Whether hidden files and directories (dotfiles) are indexed.
  bool showHiddenFiles{false};

  // Whether entries starting with '_' (helper modules, partial templates) are kept out of the index.
  bool skipUnderscorePrefixed{true};

  // Whether symbolic links are followed while scanning. Otherwise they are skipped.
  bool followSymlinks{false};

  // guard against pathological directories (0 means unlimited)
  std::size_t maxEntriesToList{10000};

  // MIME type of static files with an unknown extension.
  std::string defaultContentType{http::ContentTypeApplicationOctetStream};

  // MIME type of rendered templates whose inner extension is unknown.
  std::string templateContentType{http::ContentTypeTextHtmlUtf8};

  // Name of the cookie carrying the session passed to dynamic scripts.
  std::string sessionCookieName{"session"};

  /// Whether byte-range requests are honored (RFC 7233 single range).
  bool enableRange{true};

  // Whether conditional headers (ETag, If-* preconditions) are processed.
  bool enableConditional{true};

  // Emit Last-Modified header.
  bool addLastModified{true};

  // Emit a strong ETag derived from file size and modification time.
  bool addEtag{true};

  // Optional CSS stylesheet for directory listings (replaces the default one).
  std::string directoryListingCss;
};

}  // namespace fsroute
