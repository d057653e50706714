#pragma once

#include "rdt_message.hh"

#include <chrono>
#include <optional>

// One connection's worth of message transport, as seen by a session.
class MessageChannel
{
public:
  virtual ~MessageChannel() = default;

  virtual void send( const RDTMessage& message ) = 0;

  // Wait up to `timeout` (forever if absent) for the next message.
  // Returns the empty optional if nothing arrived in time or the peer has closed the connection.
  virtual std::optional<RDTMessage> receive( std::optional<std::chrono::milliseconds> timeout ) = 0;

  // Has the peer closed the connection (no further messages can arrive)?
  virtual bool closed() const = 0;
};
