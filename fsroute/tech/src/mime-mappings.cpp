#include "fsroute/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "fsroute/toupperlower.hpp"

namespace fsroute {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view DetermineMIMETypeStr(std::string_view path) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, {}, [](const MIMEMapping &mapping) {
        return mapping.extension.size();
      })->extension.size();

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.size() - dotPos - 1U > kMaximumKnownExtensionSize) {
    return {};
  }
  if (path.find('/', dotPos) != std::string_view::npos) {
    // the dot belongs to a directory name
    return {};
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::transform(path.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, path.end(), extBuf,
                                    [](char ch) { return tolower(ch); });
  const std::string_view ext(extBuf, endIt);

  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

}  // namespace fsroute
