#include "rdt_server.hh"

#include "rdt_receiver.hh"
#include "exception.hh"
#include "session_error.hh"

#include <utility>

using namespace std;

RDTServer::RDTServer( RDTConfig cfg, MessageChannel& channel, ostream& log )
  : cfg_( move( cfg ) ), channel_( channel ), log_( log )
{
  cfg_.validate();
}

void RDTServer::handshake()
{
  const auto hello = channel_.receive( session_timeout() );
  if ( not hello.has_value() or not holds_alternative<Hello>( hello.value() ) ) {
    throw handshake_error( "Handshake failed: expected SIN" );
  }

  channel_.send( HelloAck {} );

  const auto ack = channel_.receive( session_timeout() );
  if ( not ack.has_value() or not holds_alternative<AckHello>( ack.value() ) ) {
    throw handshake_error( "Handshake failed: expected ACK" );
  }
}

optional<RDTMessage> RDTServer::negotiate()
{
  auto request = channel_.receive( session_timeout() );
  if ( request.has_value() and holds_alternative<SizeRequest>( request.value() ) ) {
    channel_.send( SizeReply { cfg_.max_message_size, cfg_.adaptive_sizing } );
    return nullopt;
  }
  return request;
}

bool RDTServer::run( const OutputSink& deliver )
{
  handshake();
  log_ << "Connection established. MMS: " << cfg_.max_message_size
       << ", dynamic: " << ( cfg_.adaptive_sizing ? "true" : "false" ) << "\n";

  RDTReceiver receiver { cfg_.max_message_size, cfg_.adaptive_sizing };
  optional<RDTMessage> pending = negotiate();

  bool finished = false;
  while ( not finished ) {
    auto message = pending.has_value() ? exchange( pending, nullopt ) : channel_.receive( nullopt );
    if ( not message.has_value() ) {
      log_ << "Connection closed before FIN.\n";
      return false;
    }

    visit( overloaded {
             [&]( const Data& segment ) {
               const uint64_t old_max = receiver.max_segment();
               const CumAck ack = receiver.receive( segment );
               if ( segment.seqno.has_value() ) {
                 log_ << "[RECV] Seq " << segment.seqno.value() << " -> ack " << ack.ackno << "\n";
               } else {
                 log_ << "[RECV] " << summary( segment ) << " -> ack " << ack.ackno << "\n";
               }
               if ( receiver.max_segment() != old_max ) {
                 log_ << "[MSS] adjusted to " << receiver.max_segment() << "\n";
               }
               channel_.send( ack );
             },
             [&]( const Fin& ) {
               deliver( receiver.delivered() );
               channel_.send( FinAck {} );
               finished = true;
             },
             // handshake, negotiation and malformed records carry nothing for the transfer
             []( const auto& ) {},
           },
           message.value() );
  }
  return true;
}

bool serve_connection( MessageChannel& channel,
                       const RDTConfig& cfg,
                       const RDTServer::OutputSink& deliver,
                       ostream& log,
                       ostream& err )
{
  try {
    RDTServer server { cfg, channel, log };
    return server.run( deliver );
  } catch ( const handshake_error& e ) {
    err << e.what() << "\n";
  } catch ( const unix_error& e ) {
    err << "Connection error: " << e.what() << "\n";
  } catch ( const exception& e ) {
    err << "Session failed: " << e.what() << "\n";
  }
  return false;
}
