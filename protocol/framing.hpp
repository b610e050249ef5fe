#ifndef PROTOCOL_FRAMING_HPP
#define PROTOCOL_FRAMING_HPP

#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/message_lite.h"

namespace protocol {

// Frames are protobuf messages prefixed by their varint-encoded length.

// Writes a single frame to fd. Returns false if the descriptor could not be
// written, for example because the other end of the pipe was closed.
bool WriteMessage(int fd, const google::protobuf::MessageLite& message);

// Reads consecutive frames from a file descriptor, blocking until each one is
// complete. The descriptor is not owned.
class MessageReader {
 public:
  enum class Status { OK, END_OF_STREAM, MALFORMED };

  explicit MessageReader(int fd) : input_(fd) {}

  // END_OF_STREAM is returned only when the stream ends between two frames;
  // a truncated or unparsable frame is MALFORMED.
  Status Read(google::protobuf::MessageLite* message);

 private:
  google::protobuf::io::FileInputStream input_;
};

}  // namespace protocol

#endif
