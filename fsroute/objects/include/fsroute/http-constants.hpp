#pragma once

#include <string_view>

#include "fsroute/http-status-code.hpp"

namespace fsroute::http {

// Header field names are case-insensitive (RFC 7230). They are stored in their canonical form for emission.
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view IfRange = "If-Range";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view IfUnmodifiedSince = "If-Unmodified-Since";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view IfMatch = "If-Match";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view SetCookie = "Set-Cookie";

// Special fsroute headers
inline constexpr std::string_view DirectoryListingTruncated = "X-Directory-Listing-Truncated";

// Reason Phrases (only those we emit)
inline constexpr std::string_view ReasonOK = "OK";                                       // 200
inline constexpr std::string_view ReasonNoContent = "No Content";                        // 204
inline constexpr std::string_view ReasonPartialContent = "Partial Content";              // 206
inline constexpr std::string_view ReasonNotModified = "Not Modified";                    // 304
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                      // 400
inline constexpr std::string_view ReasonForbidden = "Forbidden";                         // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                          // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";         // 405
inline constexpr std::string_view ReasonPreconditionFailed = "Precondition Failed";      // 412
inline constexpr std::string_view ReasonRangeNotSatisfiable = "Range Not Satisfiable";   // 416
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";   // 500
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";      // 503

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeTextHtmlUtf8 = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for the status codes we emit, empty otherwise.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodePreconditionFailed:
      return ReasonPreconditionFailed;
    case StatusCodeRangeNotSatisfiable:
      return ReasonRangeNotSatisfiable;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    default:
      return {};
  }
}

}  // namespace fsroute::http
