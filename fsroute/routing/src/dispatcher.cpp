#include "fsroute/dispatcher.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "fsroute/collaborators.hpp"
#include "fsroute/directory-listing.hpp"
#include "fsroute/file.hpp"
#include "fsroute/http-constants.hpp"
#include "fsroute/http-method.hpp"
#include "fsroute/http-status-code.hpp"
#include "fsroute/log.hpp"
#include "fsroute/mime-mappings.hpp"
#include "fsroute/request-context.hpp"
#include "fsroute/route-kind.hpp"
#include "fsroute/session.hpp"
#include "fsroute/string-equal-ignore-case.hpp"
#include "fsroute/string-trim.hpp"
#include "fsroute/timedef.hpp"
#include "fsroute/timestring.hpp"

namespace fsroute {

namespace {

ResponseDescriptor MakeError(http::StatusCode code) {
  ResponseDescriptor resp(code);
  std::string body(http::ReasonPhraseFor(code));
  body.push_back('\n');
  resp.body(std::move(body), http::ContentTypeTextPlain);
  return resp;
}

DispatchResult MakeErrorResult(DispatchError error) {
  DispatchResult result;
  result.error = error;
  if (error == DispatchError::Cancelled) {
    result.response.status(http::StatusCodeServiceUnavailable);
  } else {
    result.response = MakeError(http::StatusCodeInternalServerError);
  }
  return result;
}

DispatchResult MakeMissResult(MissReason miss, http::MethodBmp allowedMethods) {
  DispatchResult result;
  result.miss = miss;
  result.response = MakeMissResponse(miss, allowedMethods);
  return result;
}

void AddLastModifiedHeader(ResponseDescriptor& resp, SysTimePoint tp) {
  std::array<char, kRFC7231DateStrLen> buf;
  TimeToStringRFC7231(tp, buf.data());
  resp.addHeader(http::LastModified, std::string_view(buf.data(), buf.size()));
}

inline constexpr std::size_t kMaxHexChars = sizeof(std::uint64_t) * 2;
inline constexpr std::size_t kMaxEtagSize = 1 + kMaxHexChars + 1 + kMaxHexChars + 1;

struct EtagBuf {
  [[nodiscard]] std::string_view view() const noexcept { return {buf.data(), len}; }

  std::array<char, kMaxEtagSize> buf;
  std::uint8_t len{0};
};

// "<size hex>-<mtime nanoseconds hex>"
EtagBuf MakeStrongEtag(std::uint64_t fileSize, SysTimePoint lastModified) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(lastModified.time_since_epoch()).count();

  EtagBuf etag;
  char* out = etag.buf.data();
  *out++ = '"';
  out = std::to_chars(out, etag.buf.data() + etag.buf.size(), fileSize, 16).ptr;
  *out++ = '-';
  out = std::to_chars(out, etag.buf.data() + etag.buf.size(), static_cast<std::uint64_t>(nanos), 16).ptr;
  *out++ = '"';
  etag.len = static_cast<std::uint8_t>(out - etag.buf.data());
  return etag;
}

struct RangeSelection {
  enum class State : std::uint8_t { None, Valid, Invalid, Unsatisfiable };

  State state{State::None};
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

inline constexpr std::uint64_t kInvalidUint64 = std::numeric_limits<std::uint64_t>::max();

std::uint64_t ParseUint(std::string_view token) {
  token = TrimOws(token);
  if (token.empty()) {
    return kInvalidUint64;
  }
  std::uint64_t value;
  const auto* first = token.data();
  const auto* last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return kInvalidUint64;
  }
  return value;
}

// Single range only ("bytes=a-b", "bytes=a-", "bytes=-n"). Multiple ranges are reported as Invalid.
RangeSelection ParseRange(std::string_view raw, std::uint64_t fileSize) {
  RangeSelection result;
  raw = TrimOws(raw);
  if (raw.empty()) {
    return result;
  }
  static constexpr std::string_view kBytesEqual = "bytes=";
  if (!StartsWithCaseInsensitive(raw, kBytesEqual)) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  raw = TrimOws(raw.substr(kBytesEqual.size()));
  const auto dashPos = raw.find('-');
  if (raw.empty() || raw.contains(',') || dashPos == std::string_view::npos) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  const auto firstPart = TrimOws(raw.substr(0, dashPos));
  const auto secondPart = TrimOws(raw.substr(dashPos + 1));

  if (firstPart.empty()) {
    const auto suffixLen = ParseUint(secondPart);
    if (suffixLen == kInvalidUint64) {
      result.state = RangeSelection::State::Invalid;
      return result;
    }
    if (suffixLen == 0 || fileSize == 0) {
      result.state = RangeSelection::State::Unsatisfiable;
      return result;
    }
    result.length = std::min(suffixLen, fileSize);
    result.offset = fileSize - result.length;
    result.state = RangeSelection::State::Valid;
    return result;
  }

  const auto firstValue = ParseUint(firstPart);
  const auto secondValue = secondPart.empty() ? fileSize - 1 : ParseUint(secondPart);
  if (firstValue == kInvalidUint64 || (!secondPart.empty() && secondValue == kInvalidUint64)) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  if (!secondPart.empty() && secondValue < firstValue) {
    result.state = RangeSelection::State::Invalid;
    return result;
  }
  if (firstValue >= fileSize) {
    result.state = RangeSelection::State::Unsatisfiable;
    return result;
  }
  const std::uint64_t endInclusive = std::min(secondValue, fileSize - 1);
  result.offset = firstValue;
  result.length = endInclusive - firstValue + 1;
  result.state = RangeSelection::State::Valid;
  return result;
}

// Strong comparison: weak tags never match.
bool EtagTokenMatches(std::string_view token, std::string_view etag) {
  token = TrimOws(token);
  if (token.empty() || token.starts_with("W/")) {
    return false;
  }
  return token == "*" || token == etag;
}

bool EtagListMatches(std::string_view headerValue, std::string_view etag) {
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    if (EtagTokenMatches(headerValue.substr(0, commaPos), etag)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

struct ConditionalOutcome {
  enum class Kind : std::uint8_t { None, NotModified, PreconditionFailed };

  Kind kind{Kind::None};
  bool rangeAllowed{true};
};

// RFC 7232 section 6 evaluation order. 'lastModified' is at second precision, like HTTP dates.
ConditionalOutcome EvaluateConditionals(const RequestContext& request, std::string_view etag,
                                        SysTimePoint lastModified) {
  ConditionalOutcome outcome;

  if (auto ifMatch = request.headerValue(http::IfMatch); ifMatch) {
    if (!EtagListMatches(*ifMatch, etag)) {
      outcome.kind = ConditionalOutcome::Kind::PreconditionFailed;
      outcome.rangeAllowed = false;
      return outcome;
    }
  } else if (auto ifUnmodified = request.headerValue(http::IfUnmodifiedSince); ifUnmodified) {
    const auto parsed = TryParseTimeRFC7231(*ifUnmodified);
    if (parsed != kInvalidTimePoint && lastModified > parsed) {
      outcome.kind = ConditionalOutcome::Kind::PreconditionFailed;
      outcome.rangeAllowed = false;
      return outcome;
    }
  }

  if (auto ifNoneMatch = request.headerValue(http::IfNoneMatch); ifNoneMatch) {
    if (EtagListMatches(*ifNoneMatch, etag)) {
      outcome.kind = ConditionalOutcome::Kind::NotModified;
      outcome.rangeAllowed = false;
    }
    return outcome;
  }

  if (auto ifModified = request.headerValue(http::IfModifiedSince); ifModified) {
    const auto parsed = TryParseTimeRFC7231(*ifModified);
    if (parsed != kInvalidTimePoint && lastModified <= parsed) {
      outcome.kind = ConditionalOutcome::Kind::NotModified;
      outcome.rangeAllowed = false;
    }
  }
  return outcome;
}

bool IfRangeAllowsPartial(std::string_view value, std::string_view etag, SysTimePoint lastModified) {
  value = TrimOws(value);
  if (value.empty() || value.starts_with("W/")) {
    return false;
  }
  if (value.front() == '"') {
    return value == etag;
  }
  const auto parsed = TryParseTimeRFC7231(value);
  return parsed != kInvalidTimePoint && lastModified <= parsed;
}

// Content type of a rendered template: the one of its inner extension ("page.css.tmpl" is text/css).
std::string_view TemplateContentType(const std::filesystem::path& templatePath, std::string_view defaultContentType) {
  const std::string fileName = templatePath.filename().string();
  std::string_view stem = fileName;
  const auto dotPos = stem.rfind('.');
  if (dotPos != std::string_view::npos && dotPos != 0) {
    stem = stem.substr(0, dotPos);
  }
  const auto innerType = DetermineMIMETypeStr(stem);
  return innerType.empty() ? defaultContentType : innerType;
}

}  // namespace

ResponseDescriptor MakeMissResponse(MissReason miss, http::MethodBmp allowedMethods) {
  ResponseDescriptor resp = MakeError(MissStatusCode(miss));
  if (miss == MissReason::MethodNotAllowed) {
    resp.addHeader(http::Allow, http::AllowHeaderValue(allowedMethods));
  }
  return resp;
}

TemplateContext MakeTemplateContext(const ResolvedRoute& route, const RequestContext& request) {
  TemplateContext context;
  context.emplace("request.method", http::MethodToStr(request.method()));
  context.emplace("request.path", request.rawPath());
  context.emplace("request.query", route.queryRemainder);
  context.emplace("route.path", "/" + route.descriptor().normalizedPath);
  context.emplace("route.file", route.descriptor().absoluteFilePath.string());
  for (QueryParam& param : ParseQueryParams(route.queryRemainder)) {
    context.emplace("query." + param.key, std::move(param.value));
  }
  return context;
}

Dispatcher::Dispatcher(RouteConfig config, Collaborators collaborators)
    : _config(std::move(config)), _collaborators(std::move(collaborators)) {
  _config.validate();
}

DispatchResult Dispatcher::dispatch(const ResolvedRoute& route, const RequestContext& request) const {
  const http::MethodBmp allowedMethods = route.allowedMethods();
  if (!http::IsMethodSet(allowedMethods, request.method())) {
    return MakeMissResult(MissReason::MethodNotAllowed, allowedMethods);
  }
  if (route.isListing) {
    return renderListing(route, request);
  }
  switch (route.dispatchKind()) {
    case RouteKind::Static:
      return serveStatic(route, request);
    case RouteKind::Template:
      return renderTemplate(route, request);
    case RouteKind::Dynamic:
      return executeScript(route, request);
    case RouteKind::DirectoryIndex:
    case RouteKind::Directory:
      break;
  }
  log::error("Route '{}' of kind {} cannot be dispatched", route.descriptor().normalizedPath,
             RouteKindName(route.dispatchKind()));
  return MakeMissResult(MissReason::NotFound, allowedMethods);
}

DispatchResult Dispatcher::serveStatic(const ResolvedRoute& route, const RequestContext& request) const {
  const RouteDescriptor& descriptor = route.descriptor();
  const bool isHead = request.method() == http::Method::HEAD;
  const SysTimePoint lastModified = std::chrono::floor<std::chrono::seconds>(descriptor.lastModified);

  EtagBuf etag;
  if (_config.addEtag || _config.enableConditional) {
    etag = MakeStrongEtag(descriptor.fileSize, descriptor.lastModified);
  }
  const std::string_view etagView = etag.view();

  const auto addValidators = [this, etagView, lastModified](ResponseDescriptor& resp) {
    if (_config.addEtag) {
      resp.addHeader(http::ETag, etagView);
    }
    if (_config.addLastModified) {
      AddLastModifiedHeader(resp, lastModified);
    }
    resp.addHeader(http::AcceptRanges, "bytes");
  };

  ConditionalOutcome conditionalOutcome;
  if (_config.enableConditional) {
    conditionalOutcome = EvaluateConditionals(request, etagView, lastModified);
    if (conditionalOutcome.kind == ConditionalOutcome::Kind::PreconditionFailed) {
      DispatchResult result;
      result.response = MakeError(http::StatusCodePreconditionFailed);
      addValidators(result.response);
      return result;
    }
    if (conditionalOutcome.kind == ConditionalOutcome::Kind::NotModified) {
      DispatchResult result;
      result.response.status(http::StatusCodeNotModified);
      addValidators(result.response);
      return result;
    }
  }

  File file(descriptor.absoluteFilePath.string());
  if (!file) {
    log::warn("File '{}' vanished since the last scan", descriptor.absoluteFilePath.c_str());
    return MakeMissResult(MissReason::NotFound, route.allowedMethods());
  }
  const std::uint64_t fileSize = file.size();

  RangeSelection rangeSelection;
  if (_config.enableRange && conditionalOutcome.rangeAllowed) {
    if (auto rangeHeader = request.headerValue(http::Range); rangeHeader) {
      bool allowed = true;
      if (auto ifRange = request.headerValue(http::IfRange); ifRange) {
        allowed = IfRangeAllowsPartial(*ifRange, etagView, lastModified);
      }
      if (allowed) {
        rangeSelection = ParseRange(*rangeHeader, fileSize);
      }
    }
  }

  DispatchResult result;
  if (rangeSelection.state == RangeSelection::State::Unsatisfiable) {
    result.response = MakeError(http::StatusCodeRangeNotSatisfiable);
    result.response.addHeader(http::ContentRange, std::format("bytes */{}", fileSize));
    result.response.addHeader(http::AcceptRanges, "bytes");
    if (isHead) {
      result.response.stripBody();
    }
    return result;
  }
  if (rangeSelection.state == RangeSelection::State::Invalid) {
    log::debug("Ignoring malformed range '{}'", request.headerValueOrEmpty(http::Range));
  }

  addValidators(result.response);

  std::string_view contentType = DetermineMIMETypeStr(descriptor.absoluteFilePath.native());
  if (contentType.empty()) {
    contentType = _config.defaultContentType;
  }

  if (rangeSelection.state == RangeSelection::State::Valid) {
    result.response.status(http::StatusCodePartialContent);
    result.response.addHeader(
        http::ContentRange,
        std::format("bytes {}-{}/{}", rangeSelection.offset, rangeSelection.offset + rangeSelection.length - 1,
                    fileSize));
    result.response.file(std::move(file), rangeSelection.offset, rangeSelection.length, contentType);
  } else {
    result.response.file(std::move(file), 0, fileSize, contentType);
  }
  if (isHead) {
    result.response.stripBody();
  }
  return result;
}

DispatchResult Dispatcher::renderTemplate(const ResolvedRoute& route, const RequestContext& request) const {
  const RouteDescriptor& descriptor = route.descriptor();
  if (request.stopRequested()) {
    return MakeErrorResult(DispatchError::Cancelled);
  }
  if (!_collaborators.templateRenderer) {
    log::error("No template renderer configured to render '{}'", descriptor.absoluteFilePath.c_str());
    return MakeErrorResult(DispatchError::TemplateError);
  }

  std::string body;
  try {
    body = _collaborators.templateRenderer(descriptor.absoluteFilePath, MakeTemplateContext(route, request));
  } catch (const std::exception& ex) {
    log::error("Template '{}' failed to render: {}", descriptor.absoluteFilePath.c_str(), ex.what());
    return MakeErrorResult(DispatchError::TemplateError);
  } catch (...) {
    log::error("Unknown exception while rendering template '{}'", descriptor.absoluteFilePath.c_str());
    return MakeErrorResult(DispatchError::TemplateError);
  }
  if (request.stopRequested()) {
    return MakeErrorResult(DispatchError::Cancelled);
  }

  DispatchResult result;
  result.response.body(std::move(body),
                       TemplateContentType(descriptor.absoluteFilePath, _config.templateContentType));
  if (request.method() == http::Method::HEAD) {
    result.response.stripBody();
  }
  return result;
}

DispatchResult Dispatcher::executeScript(const ResolvedRoute& route, const RequestContext& request) const {
  const RouteDescriptor& descriptor = route.descriptor();
  if (request.stopRequested()) {
    return MakeErrorResult(DispatchError::Cancelled);
  }
  if (!_collaborators.scriptExecutor) {
    log::error("No script executor configured to execute '{}'", descriptor.absoluteFilePath.c_str());
    return MakeErrorResult(DispatchError::DynamicExecutionError);
  }

  SessionAccessor session(_collaborators.sessionCodec.get(), request.cookieValue(_config.sessionCookieName));

  DispatchResult result;
  try {
    result.response = _collaborators.scriptExecutor(descriptor.absoluteFilePath, request, session);
  } catch (const std::exception& ex) {
    log::error("Script '{}' failed: {}", descriptor.absoluteFilePath.c_str(), ex.what());
    return MakeErrorResult(DispatchError::DynamicExecutionError);
  } catch (...) {
    log::error("Unknown exception in script '{}'", descriptor.absoluteFilePath.c_str());
    return MakeErrorResult(DispatchError::DynamicExecutionError);
  }
  if (request.stopRequested()) {
    return MakeErrorResult(DispatchError::Cancelled);
  }

  // the session codec is embedder code as well
  try {
    if (auto encoded = session.encodeIfModified(); encoded) {
      result.response.addHeader(http::SetCookie, MakeSessionSetCookie(_config.sessionCookieName, *encoded));
    }
  } catch (const std::exception& ex) {
    log::error("Session of script '{}' could not be encoded: {}", descriptor.absoluteFilePath.c_str(), ex.what());
    return MakeErrorResult(DispatchError::DynamicExecutionError);
  } catch (...) {
    log::error("Unknown exception while encoding the session of script '{}'", descriptor.absoluteFilePath.c_str());
    return MakeErrorResult(DispatchError::DynamicExecutionError);
  }
  if (request.method() == http::Method::HEAD) {
    result.response.stripBody();
  }
  return result;
}

DispatchResult Dispatcher::renderListing(const ResolvedRoute& route, const RequestContext& request) const {
  DirectoryListing listing = RenderDirectoryListing(*route.node, _config);

  DispatchResult result;
  result.response.addHeader(http::DirectoryListingTruncated, listing.truncated ? "1" : "0");
  result.response.body(std::move(listing.html), http::ContentTypeTextHtmlUtf8);
  if (request.method() == http::Method::HEAD) {
    result.response.stripBody();
  }
  return result;
}

}  // namespace fsroute
