#include "stream_channel.hh"

#include "exception.hh"

#include <algorithm>
#include <cerrno>
#include <poll.h>

using namespace std;
using namespace std::chrono;

void StreamChannel::send( const RDTMessage& message )
{
  fd_.write_all( serialize( message ) );
}

optional<RDTMessage> StreamChannel::take_record()
{
  const auto newline = inbound_.find( '\n' );
  if ( newline == string::npos ) {
    return nullopt;
  }
  RDTMessage message = parse_message( string_view { inbound_ }.substr( 0, newline ) );
  inbound_.erase( 0, newline + 1 );
  return message;
}

optional<RDTMessage> StreamChannel::receive( optional<milliseconds> timeout )
{
  const auto deadline = steady_clock::now() + timeout.value_or( milliseconds { 0 } );

  while ( true ) {
    if ( auto message = take_record() ) {
      return message;
    }

    if ( fd_.eof() ) {
      closed_ = true;
      // a final record without its line terminator is still a record
      if ( not inbound_.empty() ) {
        RDTMessage message = parse_message( inbound_ );
        inbound_.clear();
        return message;
      }
      return nullopt;
    }

    int wait_ms = -1;
    if ( timeout.has_value() ) {
      const auto remaining = duration_cast<milliseconds>( deadline - steady_clock::now() ).count();
      wait_ms = static_cast<int>( std::max<int64_t>( 0, remaining ) );
    }

    pollfd pfd { fd_.fd_num(), POLLIN, 0 };
    const int ready = ::poll( &pfd, 1, wait_ms );
    if ( ready < 0 ) {
      if ( errno == EINTR ) {
        continue;
      }
      throw unix_error { "poll" };
    }
    if ( ready == 0 ) {
      return nullopt;
    }

    string chunk;
    try {
      fd_.read( chunk );
    } catch ( const unix_error& e ) {
      if ( e.error_code() != ECONNRESET ) {
        throw;
      }
      closed_ = true;
      return nullopt;
    }
    inbound_.append( chunk );
  }
}
