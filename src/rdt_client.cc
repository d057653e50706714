#include "rdt_client.hh"

#include "session_error.hh"

using namespace std;
using namespace std::chrono;

RDTClient::RDTClient( RDTConfig cfg, MessageChannel& channel, ostream& log )
  : cfg_( move( cfg ) ), channel_( channel ), log_( log )
{
  cfg_.validate();
}

string RDTClient::describe( const optional<RDTMessage>& reply ) const
{
  if ( reply.has_value() ) {
    return summary( reply.value() );
  }
  return channel_.closed() ? "connection closed" : "no reply before timeout";
}

void RDTClient::handshake()
{
  channel_.send( Hello {} );

  const auto reply = channel_.receive( session_timeout() );
  if ( not reply.has_value() or not holds_alternative<HelloAck>( reply.value() ) ) {
    throw handshake_error( "Handshake failed: expected SIN/ACK, got " + describe( reply ) );
  }

  channel_.send( AckHello {} );
}

RDTSender RDTClient::negotiate()
{
  channel_.send( SizeRequest {} );

  const auto reply = channel_.receive( session_timeout() );
  if ( not reply.has_value() ) {
    throw handshake_error( "Negotiation failed: " + describe( reply ) );
  }

  uint64_t max_segment = RDTConfig::DEFAULT_MAX_SEGMENT;
  bool adaptive = false;
  visit( overloaded {
           [&]( const SizeReply& r ) {
             max_segment = r.max_size.value_or( RDTConfig::DEFAULT_MAX_SEGMENT );
             adaptive = r.adaptive.value_or( false );
           },
           []( const Malformed& m ) { throw handshake_error( "Negotiation failed: " + m.reason ); },
           // any other reply names neither parameter, so both keep their defaults
           []( const auto& ) {},
         },
         reply.value() );

  RDTSender sender { cfg_.source_data, cfg_.window_size, cfg_.timeout_ms };
  sender.negotiate( max_segment, adaptive );

  log_ << "Starting transfer. Window Size: " << cfg_.window_size << ", Initial MMS: " << sender.max_segment()
       << ( adaptive ? " (dynamic)" : "" ) << "\n";
  return sender;
}

void RDTClient::transfer( RDTSender& sender )
{
  const auto transmit = [&]( const Data& segment ) {
    log_ << "[SEND] Seq " << segment.seqno.value() << " (len: " << segment.payload->size() << ")\n";
    channel_.send( segment );
  };
  const auto retransmit = [&]( const Data& segment ) { channel_.send( segment ); };

  auto last_tick = steady_clock::now();
  while ( not sender.finished() ) {
    sender.push( transmit );

    const auto message = channel_.receive( milliseconds { cfg_.poll_interval_ms() } );

    // the wait counts against the timer as it stood before any acknowledgment rearms it
    const auto elapsed = duration_cast<milliseconds>( steady_clock::now() - last_tick );
    last_tick += elapsed;
    sender.elapse( elapsed.count() );

    if ( message.has_value() ) {
      if ( const auto* ack = get_if<CumAck>( &message.value() ) ) {
        const uint64_t old_base = sender.base();
        sender.receive( *ack );
        if ( sender.base() != old_base ) {
          log_ << "[ACK] Cumulative up to " << ack->ackno << "\n";
        }
      }
    } else if ( channel_.closed() ) {
      throw connection_closed_error( "Connection closed with " + to_string( sender.segments_in_flight() )
                                     + " segment(s) unacknowledged" );
    }

    const uint64_t timeouts = sender.timeouts();
    sender.tick( 0, retransmit );
    if ( sender.timeouts() != timeouts ) {
      log_ << "[TIMEOUT] Retransmitting window starting from " << sender.base() << "\n";
    }
  }
}

bool RDTClient::terminate()
{
  channel_.send( Fin {} );

  const auto deadline = steady_clock::now() + session_timeout();
  while ( true ) {
    const auto remaining = duration_cast<milliseconds>( deadline - steady_clock::now() );
    const auto reply = channel_.receive( std::max( remaining, milliseconds { 0 } ) );
    if ( not reply.has_value() ) {
      break;
    }
    if ( holds_alternative<FinAck>( reply.value() ) ) {
      log_ << "Transfer Complete. FIN_ACK received.\n";
      return true;
    }
    // acknowledgments of duplicate segments may still be in flight ahead of FIN_ACK
    if ( not holds_alternative<CumAck>( reply.value() ) ) {
      break;
    }
  }

  log_ << "Transfer ended without FIN_ACK.\n";
  return false;
}

TransferSummary RDTClient::run()
{
  handshake();
  RDTSender sender = negotiate();
  transfer( sender );

  TransferSummary result;
  result.segments = sender.next_seqno();
  result.timeouts = sender.timeouts();
  result.final_max_segment = sender.max_segment();
  result.fin_acknowledged = terminate();
  return result;
}
