#include "fsroute/file-router.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "fsroute/collaborators.hpp"
#include "fsroute/dispatcher.hpp"
#include "fsroute/errors.hpp"
#include "fsroute/http-method.hpp"
#include "fsroute/http-status-code.hpp"
#include "fsroute/miss.hpp"
#include "fsroute/request-context.hpp"
#include "fsroute/response-descriptor.hpp"
#include "fsroute/route-config.hpp"
#include "fsroute/route-kind.hpp"
#include "fsroute/session.hpp"
#include "fsroute/temp-file.hpp"
#include "fsroute/watcher-config.hpp"

namespace fsroute {

using test::ScopedTempDir;

namespace {

using namespace std::chrono_literals;

Collaborators MakeCollaborators() {
  Collaborators collaborators;
  collaborators.templateRenderer = [](const std::filesystem::path& templatePath, const TemplateContext& context) {
    return templatePath.filename().string() + " for " + context.at("route.path");
  };
  collaborators.scriptExecutor = [](const std::filesystem::path& scriptPath, const RequestContext& request,
                                    SessionAccessor&) {
    if (scriptPath.filename() == "broken.py") {
      throw DynamicExecutionError("script failed");
    }
    ResponseDescriptor response;
    response.body(std::string(http::MethodToStr(request.method())) + " " + scriptPath.filename().string(),
                  "text/plain");
    return response;
  };
  return collaborators;
}

// Sessions can be read but never stored back.
class ReadOnlySessionCodec : public SessionCodec {
 public:
  [[nodiscard]] std::optional<SessionData> decode(std::string_view) const override { return SessionData{}; }

  [[nodiscard]] std::string encode(const SessionData&) const override {
    throw std::runtime_error("session store unavailable");
  }
};

}  // namespace

class FileRouterTest : public ::testing::Test {
 protected:
  FileRouterTest() {
    tmpDir.writeFile("about.tmpl", "about");
    tmpDir.writeFile("static/logo.png", "0123456789");
    tmpDir.writeFile("blog/index.html", "<h1>blog</h1>");
    tmpDir.writeFile("api/users.py", "users");
    tmpDir.writeFile("api/broken.py", "broken");
  }

  RouteConfig makeConfig() const { return RouteConfig{}.withContentRoot(tmpDir.dirPath()); }

  FileRouter makeRouter(WatcherConfig watcherConfig = WatcherConfig{}.withEnabled(false)) const {
    return FileRouter(makeConfig(), MakeCollaborators(), watcherConfig);
  }

  ScopedTempDir tmpDir;
};

TEST_F(FileRouterTest, MissingContentRootThrows) {
  EXPECT_THROW(FileRouter(RouteConfig{}.withContentRoot(tmpDir.dirPath() / "missing")), IndexBuildError);
}

TEST_F(FileRouterTest, InvalidConfigThrows) {
  EXPECT_THROW(FileRouter(makeConfig().withIndexPattern("")), std::invalid_argument);
  EXPECT_THROW(FileRouter(makeConfig(), {}, WatcherConfig{}.withPollTimeout(0ms)), std::invalid_argument);
}

TEST_F(FileRouterTest, ExtensionlessTemplate) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/about"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(outcome.response.bodyInMemory(), "about.tmpl for /about");
  EXPECT_EQ(outcome.response.contentType(), "text/html; charset=utf-8");
}

TEST_F(FileRouterTest, StaticFile) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/static/logo.png"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(outcome.response.contentType(), "image/png");
  ASSERT_TRUE(outcome.response.hasFile());
  EXPECT_EQ(outcome.response.contentLength(), 10U);
}

TEST_F(FileRouterTest, TraversalIsForbidden) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/../etc/passwd"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.miss, MissReason::Forbidden);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeForbidden);
}

TEST_F(FileRouterTest, MissingIsNotFound) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/missing"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.miss, MissReason::NotFound);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeNotFound);
}

TEST_F(FileRouterTest, DirectoryIndexWithAndWithoutTrailingSlash) {
  const FileRouter router = makeRouter();
  for (const char* target : {"/blog", "/blog/"}) {
    const ResolveResult resolved = router.resolve(target);
    ASSERT_TRUE(resolved.ok()) << target;
    EXPECT_EQ(resolved.route.descriptor().kind, RouteKind::DirectoryIndex) << target;
    EXPECT_EQ(resolved.route.descriptor().absoluteFilePath.filename(), "index.html") << target;

    const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, target));
    EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeOK) << target;
    EXPECT_EQ(outcome.response.contentType(), "text/html") << target;
  }
}

TEST_F(FileRouterTest, DynamicScript) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::POST, "/api/users"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.response.bodyInMemory(), "POST users.py");
}

TEST_F(FileRouterTest, MethodNotAllowedOnStatic) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::POST, "/static/logo.png"));
  EXPECT_EQ(outcome.state, RequestState::Responded);
  EXPECT_EQ(outcome.miss, MissReason::MethodNotAllowed);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(outcome.response.headerValueOrEmpty("Allow"), "GET, HEAD");
}

TEST_F(FileRouterTest, ScriptFailureIsErrored) {
  const FileRouter router = makeRouter();
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/api/broken"));
  EXPECT_EQ(outcome.state, RequestState::Errored);
  EXPECT_EQ(outcome.error, DispatchError::DynamicExecutionError);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeInternalServerError);

  // isolated per request
  EXPECT_EQ(router.handle(RequestContext(http::Method::GET, "/api/users")).state, RequestState::Responded);
}

TEST_F(FileRouterTest, NonStandardScriptExceptionIsErrored) {
  tmpDir.writeFile("api/opaque.py", "opaque");
  Collaborators collaborators;
  collaborators.scriptExecutor = [](const std::filesystem::path&, const RequestContext&,
                                    SessionAccessor&) -> ResponseDescriptor { throw 42; };
  const FileRouter router(makeConfig(), std::move(collaborators), WatcherConfig{}.withEnabled(false));

  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/api/opaque"));
  EXPECT_EQ(outcome.state, RequestState::Errored);
  EXPECT_EQ(outcome.error, DispatchError::DynamicExecutionError);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeInternalServerError);
}

TEST_F(FileRouterTest, SessionEncodeFailureIsErrored) {
  Collaborators collaborators;
  collaborators.scriptExecutor = [](const std::filesystem::path&, const RequestContext&, SessionAccessor& session) {
    session.mutableData()["user"] = "bob";
    return ResponseDescriptor(http::StatusCodeOK);
  };
  collaborators.sessionCodec = std::make_shared<ReadOnlySessionCodec>();
  const FileRouter router(makeConfig(), std::move(collaborators), WatcherConfig{}.withEnabled(false));

  const RouterOutcome outcome = router.handle(RequestContext(http::Method::POST, "/api/users"));
  EXPECT_EQ(outcome.state, RequestState::Errored);
  EXPECT_EQ(outcome.error, DispatchError::DynamicExecutionError);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeInternalServerError);
}

TEST_F(FileRouterTest, CancelledRequestIsErrored) {
  const FileRouter router = makeRouter();
  std::stop_source stopSource;
  stopSource.request_stop();
  const RouterOutcome outcome =
      router.handle(RequestContext(http::Method::GET, "/about").withStopToken(stopSource.get_token()));
  EXPECT_EQ(outcome.state, RequestState::Errored);
  EXPECT_EQ(outcome.error, DispatchError::Cancelled);
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeServiceUnavailable);
  EXPECT_TRUE(outcome.response.bodyInMemory().empty());
  EXPECT_TRUE(router.index().lookup("about.tmpl").found());
}

TEST_F(FileRouterTest, ManualRefreshWithoutWatcher) {
  FileRouter router = makeRouter();
  EXPECT_FALSE(router.watching());
  EXPECT_EQ(router.watcher(), nullptr);

  tmpDir.writeFile("contact.tmpl", "contact");
  EXPECT_EQ(router.handle(RequestContext(http::Method::GET, "/contact")).miss, MissReason::NotFound);

  EXPECT_TRUE(router.refresh("contact.tmpl"));
  EXPECT_EQ(router.handle(RequestContext(http::Method::GET, "/contact")).state, RequestState::Responded);
}

TEST_F(FileRouterTest, WatcherPicksUpNewFiles) {
  const FileRouter router = makeRouter(WatcherConfig{}.withPollTimeout(20ms));
  ASSERT_TRUE(router.watching());

  tmpDir.writeFile("static/new.css", "body{}");
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!router.resolve("/static/new.css").ok() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  const RouterOutcome outcome = router.handle(RequestContext(http::Method::GET, "/static/new.css"));
  EXPECT_EQ(outcome.response.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(outcome.response.contentType(), "text/css");
}

TEST(RequestState, Names) {
  EXPECT_EQ(RequestStateName(RequestState::Received), "received");
  EXPECT_EQ(RequestStateName(RequestState::Errored), "errored");
}

}  // namespace fsroute
