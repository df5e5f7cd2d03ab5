#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "fsroute/file.hpp"
#include "fsroute/http-header.hpp"
#include "fsroute/http-status-code.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

// Slice of an opened file to stream as the response body.
struct FilePayload {
  File file;
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

// Transport-independent description of a response, produced by the dispatcher (or a script collaborator) and
// written by the embedding server. Body is either an in-memory string or a file slice, never both.
class ResponseDescriptor {
 public:
  ResponseDescriptor() noexcept = default;

  explicit ResponseDescriptor(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  ResponseDescriptor& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Append a header, even if one with the same name already exists.
  ResponseDescriptor& addHeader(std::string_view name, std::string_view value);

  // Set a header, replacing the value of any existing header of the same name (case-insensitive).
  ResponseDescriptor& header(std::string_view name, std::string_view value);

  // In-memory body. 'contentType' is set as Content-Type if not empty.
  ResponseDescriptor& body(std::string body, std::string_view contentType = {});

  // File slice body. 'contentType' is set as Content-Type if not empty.
  ResponseDescriptor& file(File file, std::uint64_t offset, std::uint64_t length, std::string_view contentType = {});

  // Drop the body (and the file) while keeping the headers and the announced content length (HEAD requests).
  ResponseDescriptor& stripBody() noexcept;

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept;

  [[nodiscard]] const vector<http::Header>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view contentType() const noexcept;

  [[nodiscard]] std::string_view bodyInMemory() const noexcept { return _body; }

  [[nodiscard]] bool hasFile() const noexcept { return _filePayload.has_value(); }

  [[nodiscard]] const FilePayload* filePayload() const noexcept {
    return _filePayload ? &*_filePayload : nullptr;
  }

  [[nodiscard]] FilePayload* filePayload() noexcept { return _filePayload ? &*_filePayload : nullptr; }

  // Length of the body as announced to the client (kept after stripBody()).
  [[nodiscard]] std::uint64_t contentLength() const noexcept { return _contentLength; }

 private:
  std::string _body;
  vector<http::Header> _headers;
  std::optional<FilePayload> _filePayload;
  std::uint64_t _contentLength{0};
  http::StatusCode _statusCode{http::StatusCodeOK};
};

}  // namespace fsroute
