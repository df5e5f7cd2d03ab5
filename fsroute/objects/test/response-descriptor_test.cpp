#include "fsroute/response-descriptor.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string_view>

#include "fsroute/file.hpp"
#include "fsroute/http-constants.hpp"
#include "fsroute/temp-file.hpp"

namespace fsroute {

TEST(ResponseDescriptorTest, DefaultIsOk) {
  ResponseDescriptor resp;
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.reason(), "OK");
  EXPECT_TRUE(resp.headers().empty());
  EXPECT_FALSE(resp.hasFile());
  EXPECT_EQ(resp.contentLength(), 0U);
}

TEST(ResponseDescriptorTest, HeaderReplacesAddHeaderAppends) {
  ResponseDescriptor resp(http::StatusCodeNotFound);
  resp.header("X-A", "1").header("x-a", "2").addHeader("Set-Cookie", "a=1").addHeader("Set-Cookie", "b=2");
  EXPECT_EQ(resp.reason(), "Not Found");
  ASSERT_EQ(resp.headers().size(), 3U);
  EXPECT_EQ(resp.headerValue("X-A"), std::optional<std::string_view>("2"));
  EXPECT_EQ(resp.headerValue("set-cookie"), std::optional<std::string_view>("a=1"));
}

TEST(ResponseDescriptorTest, BodySetsLengthAndContentType) {
  ResponseDescriptor resp;
  resp.body("hello", "text/plain");
  EXPECT_EQ(resp.bodyInMemory(), "hello");
  EXPECT_EQ(resp.contentLength(), 5U);
  EXPECT_EQ(resp.contentType(), "text/plain");

  resp.stripBody();
  EXPECT_TRUE(resp.bodyInMemory().empty());
  EXPECT_EQ(resp.contentLength(), 5U);
  EXPECT_EQ(resp.contentType(), "text/plain");
}

TEST(ResponseDescriptorTest, FileBody) {
  test::ScopedTempDir dir;
  const auto path = dir.writeFile("data.bin", "0123456789");
  ResponseDescriptor resp;
  resp.body("previous");
  resp.file(File(path.string()), 2, 5, http::ContentTypeApplicationOctetStream);
  EXPECT_TRUE(resp.bodyInMemory().empty());
  ASSERT_TRUE(resp.hasFile());
  EXPECT_EQ(resp.filePayload()->offset, 2U);
  EXPECT_EQ(resp.filePayload()->length, 5U);
  EXPECT_EQ(resp.contentLength(), 5U);

  resp.stripBody();
  EXPECT_FALSE(resp.hasFile());
  EXPECT_EQ(resp.contentLength(), 5U);
}

}  // namespace fsroute
