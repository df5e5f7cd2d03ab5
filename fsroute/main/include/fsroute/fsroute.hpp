// fsroute umbrella header
//
// Pulls in the public API of the route-resolution engine:
//   - the FileRouter facade and its watcher
//   - configuration types (RouteConfig, WatcherConfig)
//   - request / response descriptors and the collaborator interfaces
//   - the lower level pipeline stages, for embedders wiring their own
//
// Include the individual headers instead to keep compile times down.

#pragma once

// Facade
#include "fsroute/file-router.hpp"  // IWYU pragma: export
#include "fsroute/watcher.hpp"      // IWYU pragma: export

// Configuration
#include "fsroute/route-config.hpp"    // IWYU pragma: export
#include "fsroute/watcher-config.hpp"  // IWYU pragma: export

// Requests, responses and collaborators
#include "fsroute/body-stream.hpp"          // IWYU pragma: export
#include "fsroute/collaborators.hpp"        // IWYU pragma: export
#include "fsroute/errors.hpp"               // IWYU pragma: export
#include "fsroute/request-context.hpp"      // IWYU pragma: export
#include "fsroute/response-descriptor.hpp"  // IWYU pragma: export
#include "fsroute/session.hpp"              // IWYU pragma: export

// Pipeline stages
#include "fsroute/dispatcher.hpp"       // IWYU pragma: export
#include "fsroute/path-normalizer.hpp"  // IWYU pragma: export
#include "fsroute/resolver.hpp"         // IWYU pragma: export
#include "fsroute/route-index.hpp"      // IWYU pragma: export

// HTTP enums & helpers
#include "fsroute/http-constants.hpp"    // IWYU pragma: export
#include "fsroute/http-method.hpp"       // IWYU pragma: export
#include "fsroute/http-status-code.hpp"  // IWYU pragma: export
#include "fsroute/miss.hpp"              // IWYU pragma: export
#include "fsroute/route-kind.hpp"        // IWYU pragma: export
