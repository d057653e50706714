#include "rdt_sender.hh"

#include "rdt_config.hh"

#include <algorithm>

using namespace std;

namespace {

// Move a cut of `len` bytes back so it does not split a UTF-8 sequence
uint64_t character_boundary( string_view buffered, uint64_t len )
{
  uint64_t cut = len;
  while ( cut > 0 and cut < buffered.size() and ( static_cast<uint8_t>( buffered[cut] ) & 0xC0 ) == 0x80 ) {
    --cut;
  }
  // a single character wider than the segment size still has to go out
  return cut == 0 ? len : cut;
}

} // namespace

void RetransmissionTimer::elapse( uint64_t ms )
{
  if ( running_ ) {
    elapsed_ms_ += ms;
  }
}

void RetransmissionTimer::restart()
{
  elapsed_ms_ = 0;
  running_ = true;
}

void RetransmissionTimer::stop()
{
  running_ = false;
}

bool RetransmissionTimer::expired() const
{
  return running_ and elapsed_ms_ > timeout_ms_;
}

RDTSender::RDTSender( string_view source, uint64_t window_size, uint64_t timeout_ms )
  : window_size_( window_size ), max_segment_( RDTConfig::DEFAULT_MAX_SEGMENT ), timer_( timeout_ms )
{
  input_.writer().push( source );
  input_.writer().close();
}

void RDTSender::negotiate( uint64_t max_segment, bool adaptive )
{
  if ( max_segment > 0 ) {
    max_segment_ = max_segment;
  }
  adaptive_ = adaptive;
}

void RDTSender::push( const TransmitFunction& transmit )
{
  Reader& reader = input_.reader();
  while ( next_seqno_ < base_ + window_size_ and reader.bytes_buffered() > 0 ) {
    const uint64_t len = character_boundary( reader.peek(), std::min( max_segment_, reader.bytes_buffered() ) );
    string payload { reader.peek().substr( 0, len ) };
    reader.pop( len );

    if ( base_ == next_seqno_ ) {
      timer_.restart();
    }

    outstanding_.push_back( payload );
    transmit( Data { next_seqno_, move( payload ) } );
    ++next_seqno_;
  }
}

void RDTSender::receive( const CumAck& ack )
{
  // stale, or naming a segment that was never sent
  if ( ack.ackno < 0 or static_cast<uint64_t>( ack.ackno ) < base_
       or static_cast<uint64_t>( ack.ackno ) >= next_seqno_ ) {
    return;
  }

  const uint64_t new_base = static_cast<uint64_t>( ack.ackno ) + 1;
  while ( base_ < new_base ) {
    outstanding_.pop_front();
    ++base_;
  }

  if ( outstanding_.empty() ) {
    timer_.stop();
  } else {
    timer_.restart();
  }

  if ( adaptive_ and ack.max_size.has_value() and ack.max_size.value() > 0 ) {
    max_segment_ = ack.max_size.value();
  }
}

void RDTSender::elapse( uint64_t ms )
{
  timer_.elapse( ms );
}

void RDTSender::tick( uint64_t ms_since_last_tick, const TransmitFunction& transmit )
{
  timer_.elapse( ms_since_last_tick );
  if ( not timer_.expired() ) {
    return;
  }

  // Go-Back-N: resend every outstanding segment exactly as first cut
  uint64_t seqno = base_;
  for ( const auto& payload : outstanding_ ) {
    transmit( Data { seqno++, payload } );
  }
  ++timeouts_;
  timer_.restart();
}

bool RDTSender::finished() const
{
  return input_.reader().bytes_buffered() == 0 and base_ == next_seqno_;
}
