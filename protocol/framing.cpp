#include "protocol/framing.hpp"

#include "google/protobuf/util/delimited_message_util.h"

namespace protocol {

bool WriteMessage(int fd, const google::protobuf::MessageLite& message) {
  google::protobuf::io::FileOutputStream output(fd);
  if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(message,
                                                                  &output)) {
    return false;
  }
  return output.Flush();
}

MessageReader::Status MessageReader::Read(
    google::protobuf::MessageLite* message) {
  bool clean_eof = false;
  if (google::protobuf::util::ParseDelimitedFromZeroCopyStream(
          message, &input_, &clean_eof)) {
    return Status::OK;
  }
  return clean_eof ? Status::END_OF_STREAM : Status::MALFORMED;
}

}  // namespace protocol
