#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string_view>

#include "fsroute/response-descriptor.hpp"

namespace fsroute {

enum class StreamStatus : std::uint8_t { Completed, Cancelled, SinkClosed, ReadError };

// Receives the next body chunk. Returns false to stop streaming (client gone).
using BodySink = std::function<bool(std::string_view)>;

inline constexpr std::size_t kDefaultStreamChunkSize = 64UL * 1024UL;

// Streams the file slice to 'sink' by chunks of at most 'chunkSize' bytes.
// The stop token is checked between chunks. A file shorter than announced is a ReadError.
[[nodiscard]] StreamStatus StreamFileBody(const FilePayload& payload, const BodySink& sink, std::stop_token stopToken,
                                          std::size_t chunkSize = kDefaultStreamChunkSize);

}  // namespace fsroute
