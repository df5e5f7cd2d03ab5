#pragma once

#include <cstdint>

namespace fsroute::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodePartialContent = 206;

inline constexpr StatusCode StatusCodeNotModified = 304;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodePreconditionFailed = 412;
inline constexpr StatusCode StatusCodeRangeNotSatisfiable = 416;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

}  // namespace fsroute::http
