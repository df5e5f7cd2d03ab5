#include "fsroute/session.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace fsroute {

namespace {

// Encodes "k1=v1&k2=v2", refuses anything starting with '!'.
class PlainSessionCodec : public SessionCodec {
 public:
  [[nodiscard]] std::optional<SessionData> decode(std::string_view cookieValue) const override {
    ++nbDecodes;
    if (cookieValue.starts_with('!')) {
      return std::nullopt;
    }
    SessionData data;
    while (!cookieValue.empty()) {
      const auto ampPos = cookieValue.find('&');
      const auto pair = cookieValue.substr(0, ampPos);
      const auto eqPos = pair.find('=');
      data.emplace(std::string(pair.substr(0, eqPos)),
                   eqPos == std::string_view::npos ? std::string() : std::string(pair.substr(eqPos + 1)));
      if (ampPos == std::string_view::npos) {
        break;
      }
      cookieValue.remove_prefix(ampPos + 1);
    }
    return data;
  }

  [[nodiscard]] std::string encode(const SessionData& sessionData) const override {
    std::string ret;
    for (const auto& [key, value] : sessionData) {
      if (!ret.empty()) {
        ret.push_back('&');
      }
      ret.append(key).append("=").append(value);
    }
    return ret;
  }

  mutable int nbDecodes{0};
};

}  // namespace

TEST(SessionAccessorTest, DecodesLazilyOnce) {
  PlainSessionCodec codec;
  SessionAccessor accessor(&codec, std::string_view("user=bob"));
  EXPECT_TRUE(accessor.hasCookie());
  EXPECT_FALSE(accessor.decoded());
  EXPECT_EQ(codec.nbDecodes, 0);

  EXPECT_EQ(accessor.data().at("user"), "bob");
  EXPECT_EQ(accessor.data().size(), 1U);
  EXPECT_EQ(codec.nbDecodes, 1);
  EXPECT_FALSE(accessor.modified());
  EXPECT_EQ(accessor.encodeIfModified(), std::nullopt);
}

TEST(SessionAccessorTest, MutableAccessMarksModified) {
  PlainSessionCodec codec;
  SessionAccessor accessor(&codec, std::string_view("user=bob"));
  accessor.mutableData()["cart"] = "3";
  EXPECT_TRUE(accessor.modified());
  EXPECT_EQ(accessor.encodeIfModified(), std::optional<std::string>("cart=3&user=bob"));
}

TEST(SessionAccessorTest, InvalidCookieGivesEmptySession) {
  PlainSessionCodec codec;
  SessionAccessor accessor(&codec, std::string_view("!tampered"));
  EXPECT_TRUE(accessor.data().empty());
  EXPECT_TRUE(accessor.invalidCookie());
}

TEST(SessionAccessorTest, NoCookie) {
  PlainSessionCodec codec;
  SessionAccessor accessor(&codec, std::nullopt);
  EXPECT_FALSE(accessor.hasCookie());
  EXPECT_TRUE(accessor.data().empty());
  EXPECT_FALSE(accessor.invalidCookie());
  EXPECT_EQ(codec.nbDecodes, 0);

  accessor.mutableData()["user"] = "alice";
  EXPECT_EQ(accessor.encodeIfModified(), std::optional<std::string>("user=alice"));
}

TEST(SessionAccessorTest, NoCodecNeverPersists) {
  SessionAccessor accessor(nullptr, std::string_view("user=bob"));
  EXPECT_TRUE(accessor.data().empty());
  accessor.markModified();
  EXPECT_TRUE(accessor.modified());
  EXPECT_EQ(accessor.encodeIfModified(), std::nullopt);
}

TEST(SessionAccessorTest, SetCookieValue) {
  EXPECT_EQ(MakeSessionSetCookie("session", "abc"), "session=abc; Path=/; HttpOnly");
}

}  // namespace fsroute
