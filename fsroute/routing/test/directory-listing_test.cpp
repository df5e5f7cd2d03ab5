#include "fsroute/directory-listing.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#include "fsroute/route-config.hpp"
#include "fsroute/route-index.hpp"
#include "fsroute/route-node.hpp"
#include "fsroute/temp-file.hpp"

namespace fsroute {

using test::ScopedTempDir;

namespace {

std::string FormattedSize(std::uint64_t size) {
  std::string out;
  AppendFormattedSize(size, out);
  return out;
}

}  // namespace

TEST(DirectoryListingFormattedSize, Units) {
  EXPECT_EQ(FormattedSize(0), "0 B");
  EXPECT_EQ(FormattedSize(512), "512 B");
  EXPECT_EQ(FormattedSize(1023), "1023 B");
  EXPECT_EQ(FormattedSize(1024), "1.0 KB");
  EXPECT_EQ(FormattedSize(1536), "1.5 KB");
  EXPECT_EQ(FormattedSize(10239), "10 KB");
  EXPECT_EQ(FormattedSize(20UL * 1024UL), "20 KB");
  EXPECT_EQ(FormattedSize(1024UL * 1024UL), "1.0 MB");
  EXPECT_EQ(FormattedSize(12345678), "12 MB");
  EXPECT_EQ(FormattedSize(3UL * 1024UL * 1024UL * 1024UL), "3.0 GB");
}

class DirectoryListingTest : public ::testing::Test {
 protected:
  const RouteNode& buildAndFind(std::string_view normalizedPath) {
    index.buildFull();
    lookup = index.lookup(normalizedPath);
    return *lookup.node;
  }

  ScopedTempDir tmpDir;
  RouteConfig config{RouteConfig{}.withContentRoot(tmpDir.dirPath()).withDirectoryListing()};
  RouteIndex index{config};
  RouteLookup lookup;
};

TEST_F(DirectoryListingTest, DirectoriesFirstThenByName) {
  tmpDir.writeFile("files/zeta.txt", "z");
  tmpDir.writeFile("files/alpha.txt", "alpha");
  tmpDir.writeFile("files/beta/inner.txt", "inner");
  tmpDir.writeFile("files/gamma/inner.txt", "inner");

  const auto listing = RenderDirectoryListing(buildAndFind("files"), config);
  EXPECT_EQ(listing.nbEntries, 4U);
  EXPECT_FALSE(listing.truncated);

  const auto& html = listing.html;
  const auto betaPos = html.find("href=\"/files/beta/\"");
  const auto gammaPos = html.find("href=\"/files/gamma/\"");
  const auto alphaPos = html.find("href=\"/files/alpha.txt\"");
  const auto zetaPos = html.find("href=\"/files/zeta.txt\"");
  ASSERT_NE(betaPos, std::string::npos);
  ASSERT_NE(gammaPos, std::string::npos);
  ASSERT_NE(alphaPos, std::string::npos);
  ASSERT_NE(zetaPos, std::string::npos);
  EXPECT_LT(betaPos, gammaPos);
  EXPECT_LT(gammaPos, alphaPos);
  EXPECT_LT(alphaPos, zetaPos);

  EXPECT_NE(html.find("<title>Index of /files/</title>"), std::string::npos);
  EXPECT_NE(html.find("href=\"/\" class=\"dir\">..</a>"), std::string::npos);
  EXPECT_NE(html.find("5 B"), std::string::npos);
}

TEST_F(DirectoryListingTest, RootHasNoParentLink) {
  tmpDir.writeFile("a.txt", "a");
  const auto listing = RenderDirectoryListing(buildAndFind(""), config);
  EXPECT_NE(listing.html.find("<title>Index of /</title>"), std::string::npos);
  EXPECT_EQ(listing.html.find(">..</a>"), std::string::npos);
  EXPECT_NE(listing.html.find("href=\"/a.txt\""), std::string::npos);
}

TEST_F(DirectoryListingTest, NestedParentLink) {
  tmpDir.writeFile("a/b/c.txt", "c");
  const auto listing = RenderDirectoryListing(buildAndFind("a/b"), config);
  EXPECT_NE(listing.html.find("href=\"/a/\" class=\"dir\">..</a>"), std::string::npos);
  EXPECT_NE(listing.html.find("href=\"/a/b/c.txt\""), std::string::npos);
}

TEST_F(DirectoryListingTest, NamesAreEscapedAndEncoded) {
  tmpDir.writeFile("docs/a <b>&'c\".txt", "x");
  tmpDir.writeFile("docs/space name.txt", "x");

  const auto listing = RenderDirectoryListing(buildAndFind("docs"), config);
  const auto& html = listing.html;
  EXPECT_NE(html.find("a &lt;b&gt;&amp;&#39;c&quot;.txt</a>"), std::string::npos);
  EXPECT_NE(html.find("href=\"/docs/a%20%3Cb%3E%26%27c%22.txt\""), std::string::npos);
  EXPECT_NE(html.find("href=\"/docs/space%20name.txt\""), std::string::npos);
  EXPECT_EQ(html.find("<b>&"), std::string::npos);
}

TEST_F(DirectoryListingTest, Truncation) {
  for (int fileIdx = 0; fileIdx < 5; ++fileIdx) {
    tmpDir.writeFile(std::format("many/file{}.txt", fileIdx), "x");
  }
  config.withMaxEntriesToList(3);

  const auto listing = RenderDirectoryListing(buildAndFind("many"), config);
  EXPECT_TRUE(listing.truncated);
  EXPECT_EQ(listing.nbEntries, 3U);
  EXPECT_NE(listing.html.find("file2.txt"), std::string::npos);
  EXPECT_EQ(listing.html.find("file3.txt"), std::string::npos);
  EXPECT_NE(listing.html.find("Listing truncated after 3 entries."), std::string::npos);

  config.withMaxEntriesToList(0);
  const auto unlimited = RenderDirectoryListing(*lookup.node, config);
  EXPECT_FALSE(unlimited.truncated);
  EXPECT_EQ(unlimited.nbEntries, 5U);
}

TEST_F(DirectoryListingTest, CustomCss) {
  tmpDir.writeFile("a.txt", "a");
  config.directoryListingCss = "body{color:red;}";
  const auto listing = RenderDirectoryListing(buildAndFind(""), config);
  EXPECT_NE(listing.html.find("<style>body{color:red;}</style>"), std::string::npos);
  EXPECT_EQ(listing.html.find("font-family"), std::string::npos);
}

TEST_F(DirectoryListingTest, ListingNeverTouchesTheDisk) {
  tmpDir.writeFile("dir/kept.txt", "k");
  const RouteNode& node = buildAndFind("dir");
  tmpDir.remove("dir");

  const auto listing = RenderDirectoryListing(node, config);
  EXPECT_EQ(listing.nbEntries, 1U);
  EXPECT_NE(listing.html.find("kept.txt"), std::string::npos);
}

}  // namespace fsroute
