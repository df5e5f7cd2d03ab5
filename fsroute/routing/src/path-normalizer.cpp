#include "fsroute/path-normalizer.hpp"

#include <string>
#include <string_view>

#include "fsroute/log.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/url-decode.hpp"

namespace fsroute {

namespace {

constexpr bool IsForbiddenChar(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return uch < 0x20U || uch == 0x7FU || ch == '\\' || ch == '%';
}

NormalizedPath Forbidden(std::string_view rawPath, std::string_view why) {
  log::debug("Rejecting path '{}': {}", rawPath, why);
  return NormalizedPath{std::string(), MissReason::Forbidden, false};
}

}  // namespace

RequestTarget SplitRequestTarget(std::string_view target) noexcept {
  target = target.substr(0, target.find('#'));
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    return RequestTarget{target, {}};
  }
  return RequestTarget{target.substr(0, queryPos), target.substr(queryPos + 1)};
}

NormalizedPath NormalizePath(std::string_view rawPath) {
  if (rawPath.contains('\\')) {
    return Forbidden(rawPath, "backslash");
  }

  std::string decoded(rawPath);
  const char* decodedEnd = url::DecodeInPlace(decoded.data(), decoded.data() + decoded.size(), '+', true);
  if (decodedEnd == nullptr) {
    return Forbidden(rawPath, "invalid percent-encoding");
  }
  decoded.resize(static_cast<std::string::size_type>(decodedEnd - decoded.data()));

  NormalizedPath result;
  result.trailingSlash = decoded.ends_with('/');
  result.relative.reserve(decoded.size());

  std::string_view remaining(decoded);
  while (!remaining.empty()) {
    const auto slashPos = remaining.find('/');
    const std::string_view segment = remaining.substr(0, slashPos);
    if (segment == "..") {
      return Forbidden(rawPath, "parent directory segment");
    }
    if (!segment.empty() && segment != ".") {
      for (char ch : segment) {
        if (IsForbiddenChar(ch)) {
          return Forbidden(rawPath, "forbidden character");
        }
      }
      if (!result.relative.empty()) {
        result.relative.push_back('/');
      }
      result.relative.append(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slashPos + 1);
  }
  return result;
}

}  // namespace fsroute
