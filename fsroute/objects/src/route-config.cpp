#include "fsroute/route-config.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fsroute/route-kind.hpp"
#include "fsroute/string-equal-ignore-case.hpp"

namespace fsroute {

namespace {

// Last extension of a file name including the dot, empty if none.
// A leading dot (hidden file without extension) is not an extension.
std::string_view LastExtension(std::string_view fileName) noexcept {
  const auto dotPos = fileName.rfind('.');
  if (dotPos == std::string_view::npos || dotPos == 0) {
    return {};
  }
  return fileName.substr(dotPos);
}

void CheckExtension(std::string_view extension, std::string_view what) {
  if (extension.size() < 2 || extension.front() != '.') {
    throw std::invalid_argument(std::string("RouteConfig.") + std::string(what) + " '" + std::string(extension) +
                                "' must start with '.' followed by at least one character");
  }
  if (extension.find_first_of("/\\", 1) != std::string_view::npos) {
    throw std::invalid_argument(std::string("RouteConfig.") + std::string(what) + " '" + std::string(extension) +
                                "' must not contain path separators");
  }
}

}  // namespace

RouteConfig& RouteConfig::withExtensionKind(std::string_view extension, RouteKind kind) {
  auto it = std::ranges::find_if(extensionKinds, [extension](const ExtensionMapping& mapping) {
    return CaseInsensitiveEqual(mapping.extension, extension);
  });
  if (kind == RouteKind::Static) {
    if (it != extensionKinds.end()) {
      extensionKinds.erase(it);
    }
  } else if (it != extensionKinds.end()) {
    it->kind = kind;
  } else {
    extensionKinds.push_back(ExtensionMapping{std::string(extension), kind});
  }
  return *this;
}

RouteConfig& RouteConfig::withExtensionPriority(std::initializer_list<std::string_view> extensions) {
  extensionPriority.clear();
  for (std::string_view extension : extensions) {
    extensionPriority.emplace_back(extension);
  }
  return *this;
}

void RouteConfig::validate() const {
  for (const ExtensionMapping& mapping : extensionKinds) {
    CheckExtension(mapping.extension, "extensionKinds");
    if (mapping.kind != RouteKind::Template && mapping.kind != RouteKind::Dynamic) {
      throw std::invalid_argument("RouteConfig.extensionKinds may only map extensions to Template or Dynamic");
    }
    if (std::ranges::count_if(extensionKinds, [&mapping](const ExtensionMapping& other) {
          return CaseInsensitiveEqual(other.extension, mapping.extension);
        }) != 1) {
      throw std::invalid_argument("RouteConfig.extensionKinds has duplicated extension " + mapping.extension);
    }
  }
  for (const std::string& extension : extensionPriority) {
    CheckExtension(extension, "extensionPriority");
    if (kindForExtension(extension) == RouteKind::Static) {
      throw std::invalid_argument("RouteConfig.extensionPriority entry " + extension +
                                  " is not a template nor a dynamic extension");
    }
    if (std::ranges::count_if(extensionPriority, [&extension](const std::string& other) {
          return CaseInsensitiveEqual(other, extension);
        }) != 1) {
      throw std::invalid_argument("RouteConfig.extensionPriority has duplicated extension " + extension);
    }
  }
  if (indexPattern.empty() || indexPattern == "*") {
    throw std::invalid_argument("RouteConfig.indexPattern cannot be empty");
  }
  if (indexPattern.find_first_of("/\\") != std::string::npos) {
    throw std::invalid_argument("RouteConfig.indexPattern must not contain path separators");
  }
  const auto starPos = indexPattern.find('*');
  if (starPos != std::string::npos && starPos + 1 != indexPattern.size()) {
    throw std::invalid_argument("RouteConfig.indexPattern only supports a single trailing '*'");
  }
  if (defaultContentType.empty()) {
    throw std::invalid_argument("RouteConfig.defaultContentType cannot be empty");
  }
  if (templateContentType.empty()) {
    throw std::invalid_argument("RouteConfig.templateContentType cannot be empty");
  }
  if (sessionCookieName.empty() || sessionCookieName.find_first_of("=;, \t") != std::string::npos) {
    throw std::invalid_argument("RouteConfig.sessionCookieName must be a non empty cookie token");
  }
}

RouteKind RouteConfig::kindForExtension(std::string_view extension) const noexcept {
  for (const ExtensionMapping& mapping : extensionKinds) {
    if (CaseInsensitiveEqual(mapping.extension, extension)) {
      return mapping.kind;
    }
  }
  return RouteKind::Static;
}

RouteKind RouteConfig::kindForFileName(std::string_view fileName) const noexcept {
  const std::string_view extension = LastExtension(fileName);
  if (extension.empty()) {
    return RouteKind::Static;
  }
  return kindForExtension(extension);
}

bool RouteConfig::isIndexFileName(std::string_view fileName) const noexcept {
  const std::string_view pattern(indexPattern);
  if (!pattern.ends_with('*')) {
    return fileName == pattern;
  }
  const std::string_view prefix = pattern.substr(0, pattern.size() - 1U);
  return fileName.size() > prefix.size() && fileName.starts_with(prefix);
}

std::size_t RouteConfig::indexCandidateRank(std::string_view fileName) const noexcept {
  const std::string_view extension = LastExtension(fileName);
  std::size_t rank = 0;
  for (; rank < extensionPriority.size(); ++rank) {
    if (!extension.empty() && CaseInsensitiveEqual(extensionPriority[rank], extension)) {
      break;
    }
  }
  return rank;
}

}  // namespace fsroute
