#pragma once

#include "message_channel.hh"
#include "rdt_config.hh"

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string_view>

// The receiving peer of one session: handshake, negotiation, reassembly, termination.
class RDTServer
{
  RDTConfig cfg_;
  MessageChannel& channel_;
  std::ostream& log_;

  std::chrono::milliseconds session_timeout() const { return std::chrono::milliseconds { cfg_.timeout_ms }; }

  void handshake();

  // Answer a SIZE_REQUEST; any other message is returned for the transfer loop
  std::optional<RDTMessage> negotiate();

public:
  // Receives the reassembled data, once, when the sender finishes
  using OutputSink = std::function<void( std::string_view )>;

  RDTServer( RDTConfig cfg, MessageChannel& channel, std::ostream& log = std::cerr );

  // Serve one session. Returns true if the sender finished with FIN, false if the
  // connection closed first. Throws handshake_error if the session never got established.
  bool run( const OutputSink& deliver );
};

// Serve one session on `channel`, reporting any failure, a rejected config included, on `err`
// instead of throwing. Returns true if the sender finished with FIN.
bool serve_connection( MessageChannel& channel,
                       const RDTConfig& cfg,
                       const RDTServer::OutputSink& deliver,
                       std::ostream& log,
                       std::ostream& err );
