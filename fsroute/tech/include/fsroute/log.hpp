#pragma once

// spdlog is used header-only; force it locally instead of exporting SPDLOG_HEADER_ONLY as a public definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace fsroute {

namespace log = spdlog;

}  // namespace fsroute
