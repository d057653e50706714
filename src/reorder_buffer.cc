#include "reorder_buffer.hh"

using namespace std;

void ReorderBuffer::insert( uint64_t seqno, string payload, Writer& output )
{
  if ( seqno < next_seqno_ ) {
    return;
  }
  pending_.insert_or_assign( seqno, move( payload ) );

  for ( auto it = pending_.find( next_seqno_ ); it != pending_.end(); it = pending_.find( next_seqno_ ) ) {
    output.push( it->second );
    pending_.erase( it );
    ++next_seqno_;
  }
}
