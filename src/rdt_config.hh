#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Config for one transfer session (either peer)
class RDTConfig
{
public:
  static constexpr uint64_t DEFAULT_MAX_SEGMENT = 400; // Segment size assumed when the peer does not name one
  static constexpr uint64_t MIN_SEGMENT = 20;          // Adaptive sizing never shrinks below this
  static constexpr uint64_t SHRINK_STEP = 20;
  static constexpr uint64_t GROW_STEP = 10;
  static constexpr size_t BACKLOG_THRESHOLD = 2; // Buffered out-of-order segments tolerated before shrinking
  static constexpr uint64_t DEFAULT_WINDOW = 4;
  static constexpr uint64_t DEFAULT_TIMEOUT_MS = 5000;
  static constexpr uint64_t POLL_INTERVAL_MS = 100; // Upper bound on the acknowledgment polling granularity

  uint64_t window_size = DEFAULT_WINDOW;
  uint64_t timeout_ms = DEFAULT_TIMEOUT_MS;
  uint64_t max_message_size = DEFAULT_MAX_SEGMENT;
  bool adaptive_sizing = false;
  std::string message_path = "message.txt";
  std::string source_data {};

  void validate() const
  {
    if ( window_size == 0 ) {
      throw std::invalid_argument( "window size must be positive" );
    }
    if ( timeout_ms == 0 ) {
      throw std::invalid_argument( "timeout must be positive" );
    }
    if ( max_message_size == 0 ) {
      throw std::invalid_argument( "maximum message size must be positive" );
    }
  }

  // Kept at a tenth of the retransmission timeout or less so expiry is noticed promptly
  uint64_t poll_interval_ms() const { return std::max<uint64_t>( 1, std::min( POLL_INTERVAL_MS, timeout_ms / 10 ) ); }
};
