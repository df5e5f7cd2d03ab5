#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "fsroute/http-header.hpp"
#include "fsroute/http-method.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

// Decoded query parameter. Duplicates are preserved in order.
struct QueryParam {
  bool operator==(const QueryParam&) const = default;

  std::string key;
  std::string value;
};

using QueryParams = vector<QueryParam>;

// Decode a raw query string (without leading '?') with application/x-www-form-urlencoded rules:
// '+' is a space, malformed escapes are kept verbatim, a missing '=' gives an empty value.
QueryParams ParseQueryParams(std::string_view query);

// Transport-independent view of an incoming request, filled by the embedding server.
// It owns its strings: it can outlive the transport buffers and be handed to collaborators.
class RequestContext {
 public:
  RequestContext() = default;

  RequestContext(http::Method method, std::string_view target) : _target(target), _method(method) {}

  RequestContext& withHeader(std::string_view name, std::string_view value) {
    _headers.push_back(http::Header{std::string(name), std::string(value)});
    return *this;
  }

  RequestContext& withBody(std::string_view body) {
    _body.assign(body);
    return *this;
  }

  RequestContext& withStopToken(std::stop_token stopToken) {
    _stopToken = std::move(stopToken);
    return *this;
  }

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Raw request target as received, e.g. "/blog/post%201?page=2".
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Raw path part of the target (before any '?' or '#').
  [[nodiscard]] std::string_view rawPath() const noexcept;

  // Raw query part of the target (after '?' and before '#'), without the '?'.
  [[nodiscard]] std::string_view rawQuery() const noexcept;

  // Case-insensitive header lookup. The first occurrence wins.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Value of the cookie 'name' from the Cookie header(s), if present.
  [[nodiscard]] std::optional<std::string_view> cookieValue(std::string_view name) const noexcept;

  [[nodiscard]] const vector<http::Header>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] const std::stop_token& stopToken() const noexcept { return _stopToken; }

  [[nodiscard]] bool stopRequested() const noexcept { return _stopToken.stop_requested(); }

 private:
  std::string _target{"/"};
  std::string _body;
  vector<http::Header> _headers;
  std::stop_token _stopToken;
  http::Method _method{http::Method::GET};
};

}  // namespace fsroute
