#include "fsroute/http-method.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace fsroute::http {

TEST(HttpMethod, FromStr) {
  EXPECT_EQ(MethodFromStr("GET"), Method::GET);
  EXPECT_EQ(MethodFromStr("PATCH"), Method::PATCH);
  EXPECT_EQ(MethodFromStr("get"), std::nullopt);
  EXPECT_EQ(MethodFromStr("BREW"), std::nullopt);
}

TEST(HttpMethod, AllowHeaderValue) {
  EXPECT_EQ(AllowHeaderValue(kReadOnlyMethods), "GET, HEAD");
  EXPECT_EQ(AllowHeaderValue(kDynamicMethods), "GET, HEAD, POST, PUT, DELETE, OPTIONS, PATCH");
  EXPECT_EQ(AllowHeaderValue(0), "");
}

TEST(HttpMethod, MethodSets) {
  EXPECT_TRUE(IsMethodSet(kReadOnlyMethods, Method::HEAD));
  EXPECT_FALSE(IsMethodSet(kReadOnlyMethods, Method::POST));
  EXPECT_TRUE(IsMethodSet(kDynamicMethods, Method::DELETE));
  EXPECT_FALSE(IsMethodSet(kDynamicMethods, Method::TRACE));
  EXPECT_FALSE(IsMethodSet(kDynamicMethods, Method::CONNECT));
}

}  // namespace fsroute::http
