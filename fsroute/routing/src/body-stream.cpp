#include "fsroute/body-stream.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string_view>

#include "fsroute/file.hpp"
#include "fsroute/log.hpp"

namespace fsroute {

StreamStatus StreamFileBody(const FilePayload& payload, const BodySink& sink, std::stop_token stopToken,
                            std::size_t chunkSize) {
  if (!payload.file) {
    log::error("Cannot stream a closed file");
    return StreamStatus::ReadError;
  }
  chunkSize = std::max<std::size_t>(chunkSize, 1U);
  const std::size_t bufSize =
      static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize, std::max<std::uint64_t>(payload.length, 1U)));
  auto buf = std::make_unique_for_overwrite<std::byte[]>(bufSize);

  std::uint64_t offset = payload.offset;
  std::uint64_t remaining = payload.length;
  while (remaining != 0) {
    if (stopToken.stop_requested()) {
      log::debug("Body streaming cancelled with {} bytes remaining", remaining);
      return StreamStatus::Cancelled;
    }
    const std::size_t toRead = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, bufSize));
    const std::size_t nbRead = payload.file.readAt(std::span<std::byte>(buf.get(), toRead), offset);
    if (nbRead == File::kError || nbRead == 0) {
      log::error("Unable to read {} bytes at offset {} while streaming", toRead, offset);
      return StreamStatus::ReadError;
    }
    if (!sink(std::string_view(reinterpret_cast<const char*>(buf.get()), nbRead))) {
      return StreamStatus::SinkClosed;
    }
    offset += nbRead;
    remaining -= nbRead;
  }
  return StreamStatus::Completed;
}

}  // namespace fsroute
