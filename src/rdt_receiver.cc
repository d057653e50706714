#include "rdt_receiver.hh"

#include "rdt_config.hh"

#include <algorithm>

using namespace std;

CumAck RDTReceiver::receive( const Data& segment )
{
  if ( not segment.seqno.has_value() or not segment.payload.has_value()
       or segment.payload->size() > max_segment_ ) {
    return make_ack();
  }

  if ( segment.seqno.value() < reorder_buffer_.next_seqno() ) {
    return make_ack();
  }

  reorder_buffer_.insert( segment.seqno.value(), segment.payload.value(), delivered_.writer() );

  if ( adaptive_ ) {
    adapt_segment_size();
  }
  return make_ack();
}

void RDTReceiver::adapt_segment_size()
{
  if ( reorder_buffer_.segments_pending() > RDTConfig::BACKLOG_THRESHOLD ) {
    max_segment_ = std::max( RDTConfig::MIN_SEGMENT,
                             max_segment_ > RDTConfig::SHRINK_STEP ? max_segment_ - RDTConfig::SHRINK_STEP : 0 );
  } else if ( reorder_buffer_.segments_pending() == 0 ) {
    max_segment_ = std::min( configured_max_segment_, max_segment_ + RDTConfig::GROW_STEP );
  }
}

CumAck RDTReceiver::make_ack() const
{
  CumAck ack { static_cast<int64_t>( reorder_buffer_.next_seqno() ) - 1, {} };
  if ( adaptive_ ) {
    ack.max_size = max_segment_;
  }
  return ack;
}
