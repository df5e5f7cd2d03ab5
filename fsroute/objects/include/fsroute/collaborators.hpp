#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "fsroute/request-context.hpp"
#include "fsroute/response-descriptor.hpp"
#include "fsroute/session.hpp"

namespace fsroute {

// String data passed to templates ("request.method", "route.path", "query.<name>", ...).
using TemplateContext = std::map<std::string, std::string, std::less<>>;

// Renders the template file with given context. Returns the body, throws TemplateError on failure.
using TemplateRenderer = std::function<std::string(const std::filesystem::path& templatePath, const TemplateContext&)>;

// Executes the script file for the request. Any exception is mapped to a server error.
using ScriptExecutor = std::function<ResponseDescriptor(const std::filesystem::path& scriptPath,
                                                        const RequestContext& requestContext, SessionAccessor&)>;

// External collaborators of the dispatcher. Each one is optional: a route needing a missing collaborator fails
// with the matching error.
struct Collaborators {
  TemplateRenderer templateRenderer;
  ScriptExecutor scriptExecutor;
  std::shared_ptr<const SessionCodec> sessionCodec;
};

}  // namespace fsroute
