#pragma once

#include "voicecode/session/v1.hpp"

namespace voicecode::upload {

/*
  Outbound side of the connection. Delivery of UploadFileResult is the
  adapter's job: it hands each inbound message to AckCoordinator::HandleResponse.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual bool IsConnected() const = 0;

  // Throws if the message could not be handed to the connection.
  virtual void Send(const voicecode::session::v1::UploadFile& message) = 0;
};

} // namespace voicecode::upload
