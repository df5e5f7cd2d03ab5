#include "fsroute/response-descriptor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "fsroute/http-constants.hpp"
#include "fsroute/string-equal-ignore-case.hpp"

namespace fsroute {

ResponseDescriptor& ResponseDescriptor::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

ResponseDescriptor& ResponseDescriptor::header(std::string_view name, std::string_view value) {
  for (http::Header& existing : _headers) {
    if (CaseInsensitiveEqual(existing.name, name)) {
      existing.value.assign(value);
      return *this;
    }
  }
  return addHeader(name, value);
}

ResponseDescriptor& ResponseDescriptor::body(std::string body, std::string_view contentType) {
  _filePayload.reset();
  _body = std::move(body);
  _contentLength = _body.size();
  if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

ResponseDescriptor& ResponseDescriptor::file(File file, std::uint64_t offset, std::uint64_t length,
                                             std::string_view contentType) {
  _body.clear();
  _filePayload.emplace(FilePayload{std::move(file), offset, length});
  _contentLength = length;
  if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

ResponseDescriptor& ResponseDescriptor::stripBody() noexcept {
  _body.clear();
  _filePayload.reset();
  return *this;
}

std::string_view ResponseDescriptor::reason() const noexcept { return http::ReasonPhraseFor(_statusCode); }

std::optional<std::string_view> ResponseDescriptor::headerValue(std::string_view name) const noexcept {
  for (const http::Header& existing : _headers) {
    if (CaseInsensitiveEqual(existing.name, name)) {
      return existing.value;
    }
  }
  return std::nullopt;
}

std::string_view ResponseDescriptor::contentType() const noexcept { return headerValueOrEmpty(http::ContentType); }

}  // namespace fsroute
