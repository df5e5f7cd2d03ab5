#include "fsroute/route-config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "fsroute/route-kind.hpp"

namespace fsroute {

TEST(RouteConfigTest, DefaultShouldBeValid) {
  RouteConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
}

TEST(RouteConfigTest, DefaultExtensionTable) {
  RouteConfig cfg;
  EXPECT_EQ(cfg.kindForExtension(".tmpl"), RouteKind::Template);
  EXPECT_EQ(cfg.kindForExtension(".jinja"), RouteKind::Template);
  EXPECT_EQ(cfg.kindForExtension(".py"), RouteKind::Dynamic);
  EXPECT_EQ(cfg.kindForExtension(".png"), RouteKind::Static);
  EXPECT_EQ(cfg.kindForExtension(""), RouteKind::Static);
}

TEST(RouteConfigTest, ExtensionMatchingIsCaseInsensitive) {
  RouteConfig cfg;
  EXPECT_EQ(cfg.kindForExtension(".TMPL"), RouteKind::Template);
  EXPECT_EQ(cfg.kindForFileName("Report.Py"), RouteKind::Dynamic);
}

TEST(RouteConfigTest, KindForFileNameUsesLastExtension) {
  RouteConfig cfg;
  EXPECT_EQ(cfg.kindForFileName("page.html.tmpl"), RouteKind::Template);
  EXPECT_EQ(cfg.kindForFileName("archive.tmpl.gz"), RouteKind::Static);
  EXPECT_EQ(cfg.kindForFileName("README"), RouteKind::Static);
  // a leading dot is not an extension
  EXPECT_EQ(cfg.kindForFileName(".py"), RouteKind::Static);
}

TEST(RouteConfigTest, WithExtensionKindAddsUpdatesAndRemoves) {
  RouteConfig cfg;
  cfg.withExtensionKind(".mustache", RouteKind::Template);
  EXPECT_EQ(cfg.kindForExtension(".mustache"), RouteKind::Template);

  cfg.withExtensionKind(".PY", RouteKind::Template);
  EXPECT_EQ(cfg.kindForExtension(".py"), RouteKind::Template);
  EXPECT_EQ(cfg.extensionKinds.size(), 4U);

  cfg.withExtensionKind(".jinja", RouteKind::Static);
  EXPECT_EQ(cfg.kindForExtension(".jinja"), RouteKind::Static);

  // .jinja is still in the priority list but no longer mapped
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withExtensionPriority({".py", ".tmpl", ".mustache"});
  EXPECT_NO_THROW(cfg.validate());
}

TEST(RouteConfigTest, ValidateExtensions) {
  RouteConfig cfg;
  cfg.withExtensionKind("tmpl", RouteKind::Template);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = RouteConfig{};
  cfg.withExtensionKind(".a/b", RouteKind::Template);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = RouteConfig{};
  cfg.extensionKinds.push_back({".TMPL", RouteKind::Dynamic});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = RouteConfig{};
  cfg.extensionKinds.push_back({".dir", RouteKind::DirectoryIndex});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RouteConfigTest, ValidateExtensionPriority) {
  RouteConfig cfg;
  cfg.withExtensionPriority({".tmpl", ".py"});
  EXPECT_NO_THROW(cfg.validate());

  cfg.withExtensionPriority({".tmpl", ".tmpl"});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withExtensionPriority({".html"});
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withExtensionPriority({});
  EXPECT_NO_THROW(cfg.validate());
}

TEST(RouteConfigTest, ValidateIndexPattern) {
  RouteConfig cfg;
  cfg.withIndexPattern("home.html");
  EXPECT_NO_THROW(cfg.validate());

  cfg.withIndexPattern("");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withIndexPattern("*");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withIndexPattern("sub/index.*");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withIndexPattern("in*dex");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RouteConfigTest, ValidateContentTypesAndCookieName) {
  RouteConfig cfg;
  cfg.withDefaultContentType("");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = RouteConfig{};
  cfg.withTemplateContentType("");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = RouteConfig{};
  cfg.withSessionCookieName("a=b");
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withSessionCookieName("sid");
  EXPECT_NO_THROW(cfg.validate());
}

TEST(RouteConfigTest, IndexPatternMatching) {
  RouteConfig cfg;
  EXPECT_TRUE(cfg.isIndexFileName("index.html"));
  EXPECT_TRUE(cfg.isIndexFileName("index.py"));
  EXPECT_TRUE(cfg.isIndexFileName("index.html.tmpl"));
  EXPECT_FALSE(cfg.isIndexFileName("index."));
  EXPECT_FALSE(cfg.isIndexFileName("index"));
  EXPECT_FALSE(cfg.isIndexFileName("myindex.html"));

  cfg.withIndexPattern("default.htm");
  EXPECT_TRUE(cfg.isIndexFileName("default.htm"));
  EXPECT_FALSE(cfg.isIndexFileName("default.html"));
}

TEST(RouteConfigTest, IndexCandidateRankFollowsPriority) {
  RouteConfig cfg;
  EXPECT_EQ(cfg.indexCandidateRank("index.py"), 0U);
  EXPECT_EQ(cfg.indexCandidateRank("index.tmpl"), 1U);
  EXPECT_EQ(cfg.indexCandidateRank("index.JINJA"), 2U);
  EXPECT_EQ(cfg.indexCandidateRank("index.html"), 3U);
}

TEST(RouteConfigTest, FluentSetters) {
  RouteConfig cfg;
  cfg.withContentRoot("/srv/www")
      .withDirectoryListing()
      .withShowHiddenFiles()
      .withSkipUnderscorePrefixed(false)
      .withFollowSymlinks()
      .withMaxEntriesToList(3);
  EXPECT_EQ(cfg.contentRoot, std::filesystem::path("/srv/www"));
  EXPECT_TRUE(cfg.enableDirectoryListing);
  EXPECT_TRUE(cfg.showHiddenFiles);
  EXPECT_FALSE(cfg.skipUnderscorePrefixed);
  EXPECT_TRUE(cfg.followSymlinks);
  EXPECT_EQ(cfg.maxEntriesToList, 3U);
}

}  // namespace fsroute
