#pragma once

#include "byte_stream.hh"
#include "rdt_message.hh"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>

/*
 * The single timer covering the whole outstanding window.
 * It is armed ("restarted") whenever the oldest outstanding segment changes.
 */
class RetransmissionTimer
{
  uint64_t elapsed_ms_ { 0 };
  uint64_t timeout_ms_;
  bool running_ { false };

public:
  explicit RetransmissionTimer( uint64_t timeout_ms ) : timeout_ms_( timeout_ms ) {}

  void elapse( uint64_t ms );
  void restart();
  void stop();

  bool running() const { return running_; }

  /* A running timer expires once strictly more than the timeout has elapsed */
  bool expired() const;
};

class RDTSender
{
  ByteStream input_ {};

  uint64_t window_size_;
  uint64_t max_segment_;
  bool adaptive_ { false };

  /* Oldest unacknowledged sequence number */
  uint64_t base_ { 0 };

  /* Next sequence number to assign */
  uint64_t next_seqno_ { 0 };

  /* Payloads of segments [base_, next_seqno_), oldest first */
  std::deque<std::string> outstanding_ {};

  RetransmissionTimer timer_;

  uint64_t timeouts_ { 0 };

public:
  /* Construct a sender for `source`, with a fixed window and a retransmission timeout */
  RDTSender( std::string_view source, uint64_t window_size, uint64_t timeout_ms );

  /* Adopt the parameters agreed during negotiation */
  void negotiate( uint64_t max_segment, bool adaptive );

  /* Type of the `transmit` function that push and tick use to send segments */
  using TransmitFunction = std::function<void( const Data& )>;

  /* Cut and send new segments while the window has room */
  void push( const TransmitFunction& transmit );

  /* Receive and process a cumulative acknowledgment from the peer's receiver */
  void receive( const CumAck& ack );

  /* Credit elapsed time to the retransmission timer without acting on an expiry */
  void elapse( uint64_t ms );

  /* Time has passed by the given # of milliseconds since the last time the tick() method was called */
  void tick( uint64_t ms_since_last_tick, const TransmitFunction& transmit );

  /* All source data has been cut into segments and every segment is acknowledged */
  bool finished() const;

  // Accessors
  uint64_t base() const { return base_; }
  uint64_t next_seqno() const { return next_seqno_; }
  uint64_t max_segment() const { return max_segment_; }
  uint64_t segments_in_flight() const { return next_seqno_ - base_; }
  bool timer_running() const { return timer_.running(); }
  uint64_t timeouts() const { return timeouts_; } // How many times has the whole window been resent?
};
