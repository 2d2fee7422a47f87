// Repository: ReelForge
// Component: Export Host Channel
// Purpose: Length-delimited protobuf framing over the host's stdio pipes.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_IPC_EXPORT_HOST_CHANNEL_HPP_
#define REELFORGE_IPC_EXPORT_HOST_CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <google/protobuf/message_lite.h>

namespace reelforge::ipc {

// Upper bound on one framed message; larger prefixes are treated as a
// corrupt stream.
inline constexpr uint32_t kMaxMessageBytes = 4u * 1024u * 1024u;

// Writes `message` with a varint length prefix. Blocking.
bool WriteMessage(int fd, const google::protobuf::MessageLite& message, std::string* error);

// Blocking read of one framed message. `clean_eof` is set when the stream
// ended before the first byte of a message. The reader buffers, so use it
// only for a stream that carries a single message.
bool ReadMessage(int fd, google::protobuf::MessageLite* message, bool* clean_eof,
                 std::string* error);

// MessageFrameReader splits a byte stream fed in arbitrary pieces (from a
// non-blocking pipe) into framed messages.
class MessageFrameReader {
 public:
  enum class Status {
    kMessage = 0,  // `message` was filled
    kNeedMore,     // incomplete frame buffered
    kMalformed,    // bad length prefix or unparsable payload
  };

  void Append(const char* data, size_t size);
  void Append(const std::string& data) { Append(data.data(), data.size()); }

  Status Next(google::protobuf::MessageLite* message);

  size_t buffered() const { return buffer_.size() - offset_; }

 private:
  void Compact();

  std::string buffer_;
  size_t offset_ = 0;
};

}  // namespace reelforge::ipc

#endif  // REELFORGE_IPC_EXPORT_HOST_CHANNEL_HPP_
