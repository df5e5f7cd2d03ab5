#include "fsroute/request-context.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "fsroute/http-constants.hpp"
#include "fsroute/string-equal-ignore-case.hpp"
#include "fsroute/string-trim.hpp"
#include "fsroute/url-decode.hpp"

namespace fsroute {

namespace {

std::string DecodeQueryComponent(std::string_view component) {
  std::string ret(component);
  char* end = url::DecodeInPlace(ret.data(), ret.data() + ret.size(), ' ', false);
  ret.resize(static_cast<std::string::size_type>(end - ret.data()));
  return ret;
}

}  // namespace

QueryParams ParseQueryParams(std::string_view query) {
  QueryParams params;
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    if (!pair.empty()) {
      const auto eqPos = pair.find('=');
      if (eqPos == std::string_view::npos) {
        params.push_back(QueryParam{DecodeQueryComponent(pair), std::string()});
      } else {
        params.push_back(QueryParam{DecodeQueryComponent(pair.substr(0, eqPos)),
                                    DecodeQueryComponent(pair.substr(eqPos + 1))});
      }
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
  return params;
}

std::string_view RequestContext::rawPath() const noexcept {
  const std::string_view target(_target);
  return target.substr(0, target.find_first_of("?#"));
}

std::string_view RequestContext::rawQuery() const noexcept {
  std::string_view target(_target);
  target = target.substr(0, target.find('#'));
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    return {};
  }
  return target.substr(queryPos + 1);
}

std::optional<std::string_view> RequestContext::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return TrimOws(header.value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> RequestContext::cookieValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (!CaseInsensitiveEqual(header.name, http::Cookie)) {
      continue;
    }
    std::string_view cookies(header.value);
    while (!cookies.empty()) {
      const auto sepPos = cookies.find(';');
      const std::string_view cookie = TrimOws(cookies.substr(0, sepPos));
      const auto eqPos = cookie.find('=');
      if (eqPos != std::string_view::npos && TrimOws(cookie.substr(0, eqPos)) == name) {
        std::string_view value = TrimOws(cookie.substr(eqPos + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
          value = value.substr(1, value.size() - 2);
        }
        return value;
      }
      if (sepPos == std::string_view::npos) {
        break;
      }
      cookies.remove_prefix(sepPos + 1);
    }
  }
  return std::nullopt;
}

}  // namespace fsroute
