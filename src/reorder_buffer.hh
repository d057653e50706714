#pragma once

#include "byte_stream.hh"

#include <cstdint>
#include <string>
#include <unordered_map>

class ReorderBuffer
{
private:
  // The sequence number of the next segment to be written to the output.
  uint64_t next_seqno_ { 0 };
  // Segments that arrived ahead of `next_seqno_`, by sequence number.
  std::unordered_map<uint64_t, std::string> pending_ {};

public:
  /*
   * Insert a segment to be reassembled into a ByteStream.
   *   `seqno`: the sequence number of the segment
   *   `payload`: the segment itself
   *   `output`: a mutable reference to the Writer
   *
   * Segments may arrive in any order and any number of times. As soon as the
   * segment numbered `next_seqno()` is known, it is written to the output along
   * with every segment that directly follows it and has already arrived.
   *
   * A segment numbered below `next_seqno()` has already been written and is ignored.
   * A later copy of a pending segment replaces the earlier one.
   */
  void insert( uint64_t seqno, std::string payload, Writer& output );

  // Sequence number of the first segment not yet written to the output
  uint64_t next_seqno() const { return next_seqno_; }

  // How many segments are stored in the ReorderBuffer itself?
  size_t segments_pending() const { return pending_.size(); }

  bool contains( uint64_t seqno ) const { return pending_.contains( seqno ); }
};
