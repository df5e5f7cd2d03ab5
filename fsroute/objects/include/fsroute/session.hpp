#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fsroute {

// Opaque session content. The router never inspects it.
using SessionData = std::map<std::string, std::string, std::less<>>;

// Session cookie (de)serialization, including any signing or encryption. Implemented by the embedding application.
class SessionCodec {
 public:
  virtual ~SessionCodec() = default;

  // Returns std::nullopt if the cookie value cannot be decoded (tampered, expired, malformed).
  [[nodiscard]] virtual std::optional<SessionData> decode(std::string_view cookieValue) const = 0;

  [[nodiscard]] virtual std::string encode(const SessionData& sessionData) const = 0;
};

// Per-request lazy access to the session, handed to dynamic scripts.
// The cookie is decoded on first access only. Without a codec, the session is always empty and never persisted.
class SessionAccessor {
 public:
  SessionAccessor() noexcept = default;

  SessionAccessor(const SessionCodec* codec, std::optional<std::string_view> cookieValue);

  [[nodiscard]] bool hasCookie() const noexcept { return _cookieValue.has_value(); }

  // Decoded session, empty if there is no cookie or if it could not be decoded.
  [[nodiscard]] const SessionData& data();

  // Mutable access, marks the session as modified.
  [[nodiscard]] SessionData& mutableData();

  void markModified() noexcept { _modified = true; }

  [[nodiscard]] bool modified() const noexcept { return _modified; }

  [[nodiscard]] bool decoded() const noexcept { return _decoded; }

  // True if a cookie was present but rejected by the codec.
  [[nodiscard]] bool invalidCookie();

  // Encoded value to send back, only if the session was modified and a codec is available.
  [[nodiscard]] std::optional<std::string> encodeIfModified() const;

 private:
  void ensureDecoded();

  const SessionCodec* _codec{nullptr};
  std::optional<std::string> _cookieValue;
  SessionData _data;
  bool _decoded{false};
  bool _invalidCookie{false};
  bool _modified{false};
};

// Set-Cookie header value for a session cookie.
std::string MakeSessionSetCookie(std::string_view cookieName, std::string_view cookieValue);

}  // namespace fsroute
