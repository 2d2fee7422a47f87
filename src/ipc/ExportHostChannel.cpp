// Repository: ReelForge
// Component: Export Host Channel
// Purpose: Length-delimited protobuf framing over the host's stdio pipes.
// Copyright (c) 2025 ReelForge

#include "reelforge/ipc/ExportHostChannel.hpp"

#include <cerrno>
#include <cstring>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/delimited_message_util.h>

namespace reelforge::ipc {

namespace {

// Longest varint32 encoding.
constexpr size_t kMaxPrefixBytes = 5;

}  // namespace

bool WriteMessage(int fd, const google::protobuf::MessageLite& message, std::string* error) {
  if (!google::protobuf::util::SerializeDelimitedToFileDescriptor(message, fd)) {
    if (error) *error = std::string("write failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

bool ReadMessage(int fd, google::protobuf::MessageLite* message, bool* clean_eof,
                 std::string* error) {
  google::protobuf::io::FileInputStream input(fd);
  bool eof = false;
  const bool ok =
      google::protobuf::util::ParseDelimitedFromZeroCopyStream(message, &input, &eof);
  if (clean_eof) *clean_eof = eof;
  if (!ok && error) {
    *error = eof ? "stream closed before a message arrived" : "malformed message";
  }
  return ok;
}

void MessageFrameReader::Append(const char* data, size_t size) {
  Compact();
  buffer_.append(data, size);
}

void MessageFrameReader::Compact() {
  if (offset_ == 0) return;
  buffer_.erase(0, offset_);
  offset_ = 0;
}

MessageFrameReader::Status MessageFrameReader::Next(google::protobuf::MessageLite* message) {
  const size_t available = buffered();
  if (available == 0) return Status::kNeedMore;

  const auto* data = reinterpret_cast<const uint8_t*>(buffer_.data() + offset_);
  google::protobuf::io::ArrayInputStream raw(data, static_cast<int>(available));
  google::protobuf::io::CodedInputStream coded(&raw);

  uint32_t length = 0;
  if (!coded.ReadVarint32(&length)) {
    return available >= kMaxPrefixBytes ? Status::kMalformed : Status::kNeedMore;
  }
  if (length > kMaxMessageBytes) return Status::kMalformed;

  const size_t prefix = static_cast<size_t>(coded.CurrentPosition());
  if (available - prefix < length) return Status::kNeedMore;

  if (!message->ParseFromArray(data + prefix, static_cast<int>(length))) {
    return Status::kMalformed;
  }
  offset_ += prefix + length;
  return Status::kMessage;
}

}  // namespace reelforge::ipc
