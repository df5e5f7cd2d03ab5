// Resolver benchmarks measuring path resolution over an indexed content tree:
//  - Direct hits of files at various depths
//  - Directory index fallback and extension inference
//  - Misses (not found, traversal rejected by the normalizer)
//  - Incremental refresh of a single entry

#include <benchmark/benchmark.h>

#include <cstdint>
#include <format>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include "fsroute/path-normalizer.hpp"
#include "fsroute/resolver.hpp"
#include "fsroute/route-config.hpp"
#include "fsroute/temp-file.hpp"
#include "fsroute/vector.hpp"

namespace fsroute {

namespace {

std::mt19937_64 gen;

}  // namespace

// -----------------------------------------------------------------------------
// Fixture: a small site with pages, a blog, static assets and scripts
// -----------------------------------------------------------------------------
class SiteFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    tmpDir = std::make_unique<test::ScopedTempDir>("fsroute-bench-");
    tmpDir->writeFile("index.html", "home");
    tmpDir->writeFile("about.tmpl", "about");
    tmpDir->writeFile("contact.tmpl", "contact");
    tmpDir->writeFile("blog/index.html", "blog");
    for (int postPos = 0; postPos < 50; ++postPos) {
      tmpDir->writeFile(std::format("blog/2024/post-{}.md", postPos), "post");
    }
    for (int assetPos = 0; assetPos < 50; ++assetPos) {
      tmpDir->writeFile(std::format("static/img/logo-{}.png", assetPos), "png");
    }
    tmpDir->writeFile("static/css/site.css", "css");
    tmpDir->writeFile("api/v1/users.py", "users");
    tmpDir->writeFile("api/v1/orders.py", "orders");

    resolver = std::make_unique<Resolver>(RouteConfig{}.withContentRoot(tmpDir->dirPath()).withDirectoryListing());
    resolver->index().buildFull();

    targets = vector<std::string_view>{"/",
                                       "/about",
                                       "/blog/",
                                       "/blog/2024/post-7.md",
                                       "/static/img/logo-3.png",
                                       "/api/v1/users",
                                       "/static/css/",
                                       "/missing",
                                       "/../etc/passwd",
                                       "/about?lang=en"};
  }

  void TearDown(const benchmark::State& /* state */) override {
    resolver.reset();
    tmpDir.reset();
  }

  std::string_view pickRandomTarget() {
    std::uniform_int_distribution<uint32_t> dist(0, static_cast<uint32_t>(targets.size() - 1));
    return targets[dist(gen)];
  }

  std::unique_ptr<test::ScopedTempDir> tmpDir;
  std::unique_ptr<Resolver> resolver;
  vector<std::string_view> targets;
};

BENCHMARK_F(SiteFixture, NormalizeOnly)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = NormalizePath("/blog/2024/post%2D7.md");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveRoot)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveDeepFile)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/blog/2024/post-42.md");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveDirectoryIndex)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/blog");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveExtensionInference)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/api/v1/orders");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveNotFound)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/static/img/missing");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveTraversal)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget("/static/%2e%2e/%2e%2e/etc/passwd");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, ResolveRandomTargets)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = resolver->resolveTarget(pickRandomTarget());
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SiteFixture, RefreshSingleFile)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto published = resolver->index().refresh("blog/2024/post-7.md");
    benchmark::DoNotOptimize(published);
  }
}

BENCHMARK_F(SiteFixture, RefreshLargeDirectory)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto published = resolver->index().refresh("static/img");
    benchmark::DoNotOptimize(published);
  }
}

}  // namespace fsroute

BENCHMARK_MAIN();
