#pragma once

#include "byte_stream.hh"
#include "rdt_message.hh"
#include "reorder_buffer.hh"

#include <cstdint>
#include <string_view>

class RDTReceiver
{
  // Ceiling for adaptive growth: the locally configured maximum
  uint64_t configured_max_segment_;
  uint64_t max_segment_;
  bool adaptive_;

  ReorderBuffer reorder_buffer_ {};
  ByteStream delivered_ {};

  void adapt_segment_size();

public:
  RDTReceiver( uint64_t max_segment, bool adaptive )
    : configured_max_segment_( max_segment ), max_segment_( max_segment ), adaptive_( adaptive )
  {}

  /*
   * Process one DATA segment and return the acknowledgment to send back.
   * An acknowledgment is produced for every segment, including ones that are
   * rejected (missing sequence number or payload, oversized) or already delivered.
   */
  CumAck receive( const Data& segment );

  // The acknowledgment describing the current state
  CumAck make_ack() const;

  // Everything delivered so far, in sequence order
  std::string_view delivered() const { return delivered_.reader().peek(); }

  // Accessors
  uint64_t next_seqno() const { return reorder_buffer_.next_seqno(); }
  uint64_t max_segment() const { return max_segment_; }
  const ReorderBuffer& reorder_buffer() const { return reorder_buffer_; }
};
