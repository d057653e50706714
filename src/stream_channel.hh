#pragma once

#include "file_descriptor.hh"
#include "message_channel.hh"

#include <string>
#include <utility>

// A MessageChannel over a connected byte stream: one record per line.
class StreamChannel : public MessageChannel
{
  FileDescriptor fd_;
  std::string inbound_ {};
  bool closed_ { false };

  std::optional<RDTMessage> take_record();

public:
  explicit StreamChannel( FileDescriptor&& fd ) : fd_( std::move( fd ) ) {}

  void send( const RDTMessage& message ) override;
  std::optional<RDTMessage> receive( std::optional<std::chrono::milliseconds> timeout ) override;
  bool closed() const override { return closed_; }
};
