#include "fsroute/session.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "fsroute/log.hpp"

namespace fsroute {

SessionAccessor::SessionAccessor(const SessionCodec* codec, std::optional<std::string_view> cookieValue)
    : _codec(codec) {
  if (cookieValue) {
    _cookieValue.emplace(*cookieValue);
  }
}

void SessionAccessor::ensureDecoded() {
  if (_decoded) {
    return;
  }
  _decoded = true;
  if (_codec == nullptr || !_cookieValue) {
    return;
  }
  auto decodedData = _codec->decode(*_cookieValue);
  if (decodedData) {
    _data = std::move(*decodedData);
  } else {
    _invalidCookie = true;
    log::debug("Session cookie rejected by codec, starting from an empty session");
  }
}

const SessionData& SessionAccessor::data() {
  ensureDecoded();
  return _data;
}

SessionData& SessionAccessor::mutableData() {
  ensureDecoded();
  _modified = true;
  return _data;
}

bool SessionAccessor::invalidCookie() {
  ensureDecoded();
  return _invalidCookie;
}

std::optional<std::string> SessionAccessor::encodeIfModified() const {
  if (!_modified || _codec == nullptr) {
    return std::nullopt;
  }
  return _codec->encode(_data);
}

std::string MakeSessionSetCookie(std::string_view cookieName, std::string_view cookieValue) {
  std::string ret;
  ret.reserve(cookieName.size() + cookieValue.size() + 26U);
  ret.append(cookieName);
  ret.push_back('=');
  ret.append(cookieValue);
  ret.append("; Path=/; HttpOnly");
  return ret;
}

}  // namespace fsroute
