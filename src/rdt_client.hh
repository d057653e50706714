#pragma once

#include "message_channel.hh"
#include "rdt_config.hh"
#include "rdt_sender.hh"

#include <chrono>
#include <cstdint>
#include <iostream>

struct TransferSummary
{
  uint64_t segments {};          // distinct segments cut from the source data
  uint64_t timeouts {};          // whole-window retransmissions
  uint64_t final_max_segment {}; // segment size in force when the transfer ended
  bool fin_acknowledged {};
};

// The sending peer of one session: handshake, negotiation, sliding-window transfer, termination.
class RDTClient
{
  RDTConfig cfg_;
  MessageChannel& channel_;
  std::ostream& log_;

  std::chrono::milliseconds session_timeout() const { return std::chrono::milliseconds { cfg_.timeout_ms }; }
  std::string describe( const std::optional<RDTMessage>& reply ) const;

  void handshake();
  RDTSender negotiate();
  void transfer( RDTSender& sender );
  bool terminate();

public:
  RDTClient( RDTConfig cfg, MessageChannel& channel, std::ostream& log = std::cerr );

  // Run the session to completion. Throws handshake_error or connection_closed_error.
  TransferSummary run();
};
