#include "rdt_client.hh"
#include "rdt_server.hh"
#include "session_error.hh"
#include "socket.hh"
#include "stream_channel.hh"
#include "test_channels.hh"

#include <gtest/gtest.h>

#include <csignal>
#include <deque>
#include <future>
#include <sstream>
#include <thread>

using namespace std;
using namespace std::chrono;

namespace {

RDTConfig client_config( string source, uint64_t window, uint64_t timeout_ms )
{
  RDTConfig cfg;
  cfg.source_data = move( source );
  cfg.window_size = window;
  cfg.timeout_ms = timeout_ms;
  return cfg;
}

RDTConfig server_config( uint64_t max_message_size, bool adaptive )
{
  RDTConfig cfg;
  cfg.max_message_size = max_message_size;
  cfg.adaptive_sizing = adaptive;
  cfg.timeout_ms = 2000;
  return cfg;
}

template<typename T>
bool is( const RDTMessage& message )
{
  return holds_alternative<T>( message );
}

// Acknowledges segment 0 after a short wait, then stays silent until segment 1 is sent again
class SlowAckChannel : public MessageChannel
{
  deque<RDTMessage> replies_ { HelloAck {}, SizeReply { 5, false } };
  bool first_acked_ { false };

public:
  steady_clock::time_point ack_returned {};
  steady_clock::time_point resent {};
  int second_segment_sends { 0 };

  void send( const RDTMessage& message ) override
  {
    const auto* data = get_if<Data>( &message );
    if ( data != nullptr and data->seqno == 1U and ++second_segment_sends == 2 ) {
      resent = steady_clock::now();
      replies_.push_back( CumAck { 1, {} } );
    }
    if ( is<Fin>( message ) ) {
      replies_.push_back( FinAck {} );
    }
  }

  optional<RDTMessage> receive( optional<milliseconds> timeout ) override
  {
    if ( not replies_.empty() ) {
      RDTMessage reply = move( replies_.front() );
      replies_.pop_front();
      return reply;
    }
    if ( not first_acked_ ) {
      this_thread::sleep_for( milliseconds { 95 } );
      first_acked_ = true;
      ack_returned = steady_clock::now();
      return CumAck { 0, {} };
    }
    this_thread::sleep_for( timeout.value_or( milliseconds { 100 } ) );
    return nullopt;
  }

  bool closed() const override { return false; }
};

} // namespace

class SessionTest : public ::testing::Test
{
protected:
  static void SetUpTestSuite() { signal( SIGPIPE, SIG_IGN ); }

  ostringstream client_log_ {};
  ostringstream server_log_ {};

  struct Outcome
  {
    TransferSummary summary {};
    bool fin_received {};
    string delivered {};
  };

  // Run both peers over a connected socket pair, the server on its own thread
  Outcome transfer( const RDTConfig& client_cfg, const RDTConfig& server_cfg, set<uint64_t> drop_once = {} )
  {
    auto [client_end, server_end] = socket_pair_helper();

    Outcome outcome;
    auto server_done = async( launch::async, [&, fd = move( server_end )]() mutable {
      StreamChannel channel { move( fd ) };
      RDTServer server { server_cfg, channel, server_log_ };
      return server.run( [&]( string_view data ) { outcome.delivered = data; } );
    } );

    StreamChannel stream { move( client_end ) };
    LossyChannel channel { stream, move( drop_once ) };
    RDTClient client { client_cfg, channel, client_log_ };
    outcome.summary = client.run();
    outcome.fin_received = server_done.get();
    return outcome;
  }
};

TEST_F( SessionTest, SmallMessageInTwoSegments )
{
  const auto outcome = transfer( client_config( "HELLO WORLD", 2, 1000 ), server_config( 10, false ) );

  EXPECT_TRUE( outcome.fin_received );
  EXPECT_TRUE( outcome.summary.fin_acknowledged );
  EXPECT_EQ( outcome.delivered, "HELLO WORLD" );
  EXPECT_EQ( outcome.summary.segments, 2U );
  EXPECT_EQ( outcome.summary.timeouts, 0U );
  EXPECT_NE( client_log_.str().find( "[SEND] Seq 0 (len: 10)" ), string::npos );
  EXPECT_NE( client_log_.str().find( "[SEND] Seq 1 (len: 1)" ), string::npos );
  EXPECT_NE( client_log_.str().find( "Transfer Complete. FIN_ACK received." ), string::npos );
}

TEST_F( SessionTest, LargeMessageWithAdaptiveSizing )
{
  string source;
  for ( int i = 0; i < 400; i++ ) {
    source += "line " + to_string( i ) + " \"quoted\"\n";
  }

  const auto outcome = transfer( client_config( source, 4, 1000 ), server_config( 64, true ) );

  EXPECT_TRUE( outcome.summary.fin_acknowledged );
  EXPECT_EQ( outcome.delivered, source );
  EXPECT_LE( outcome.summary.final_max_segment, 64U );
}

TEST_F( SessionTest, LostSegmentIsRecoveredByTimeout )
{
  const string source = "0123456789abcdefghijABCDEFGHIJ!@#$%^&*()";
  const auto outcome = transfer( client_config( source, 4, 200 ), server_config( 10, false ), { 1 } );

  EXPECT_TRUE( outcome.summary.fin_acknowledged );
  EXPECT_EQ( outcome.delivered, source );
  EXPECT_EQ( outcome.summary.segments, 4U );
  EXPECT_GE( outcome.summary.timeouts, 1U );
  EXPECT_NE( client_log_.str().find( "[TIMEOUT] Retransmitting window starting from 1" ), string::npos );
}

TEST_F( SessionTest, RearmedTimerWaitsAFullTimeout )
{
  SlowAckChannel channel;
  RDTClient client { client_config( "0123456789", 2, 1000 ), channel, client_log_ };

  const TransferSummary summary = client.run();
  EXPECT_TRUE( summary.fin_acknowledged );
  EXPECT_EQ( summary.timeouts, 1U );
  ASSERT_EQ( channel.second_segment_sends, 2 );
  EXPECT_GE( channel.resent - channel.ack_returned, milliseconds { 1000 } );
}

TEST_F( SessionTest, ClientAbortsOnWrongHandshakeReply )
{
  ScriptedChannel channel { { FinAck {} } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };

  EXPECT_THROW( client.run(), handshake_error );
  ASSERT_EQ( channel.sent.size(), 1U );
  EXPECT_TRUE( is<Hello>( channel.sent[0] ) );
}

TEST_F( SessionTest, ClientAbortsWhenNegotiationGetsNoReply )
{
  ScriptedChannel channel { { HelloAck {} } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };

  EXPECT_THROW( client.run(), handshake_error );
  ASSERT_EQ( channel.sent.size(), 3U );
  EXPECT_TRUE( is<AckHello>( channel.sent[1] ) );
  EXPECT_TRUE( is<SizeRequest>( channel.sent[2] ) );
}

TEST_F( SessionTest, ClientAbortsOnMalformedNegotiationReply )
{
  ScriptedChannel channel { { HelloAck {}, Malformed { "bad record" } } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };
  EXPECT_THROW( client.run(), handshake_error );
}

TEST_F( SessionTest, ClientFallsBackToDefaultSizeAndSkipsStaleAcks )
{
  ScriptedChannel channel { { HelloAck {}, FinAck {}, CumAck { 0, {} }, CumAck { 0, {} }, FinAck {} } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };

  const TransferSummary summary = client.run();
  EXPECT_TRUE( summary.fin_acknowledged );
  EXPECT_EQ( summary.final_max_segment, RDTConfig::DEFAULT_MAX_SEGMENT );
  EXPECT_EQ( summary.segments, 1U );

  ASSERT_EQ( channel.sent.size(), 5U );
  ASSERT_TRUE( is<Data>( channel.sent[3] ) );
  EXPECT_EQ( get<Data>( channel.sent[3] ).payload, "data" );
  EXPECT_TRUE( is<Fin>( channel.sent[4] ) );
}

TEST_F( SessionTest, ClientReportsClosedConnectionMidTransfer )
{
  ScriptedChannel channel { { HelloAck {}, SizeReply { 2, false } } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };
  EXPECT_THROW( client.run(), connection_closed_error );
}

TEST_F( SessionTest, ClientEndsWithoutConfirmationWhenFinAckMissing )
{
  ScriptedChannel channel { { HelloAck {}, SizeReply { 10, false }, CumAck { 0, {} } } };
  RDTClient client { client_config( "data", 4, 100 ), channel, client_log_ };

  const TransferSummary summary = client.run();
  EXPECT_FALSE( summary.fin_acknowledged );
  EXPECT_TRUE( is<Fin>( channel.sent.back() ) );
}

TEST_F( SessionTest, ServerDropsConnectionWithoutHello )
{
  ScriptedChannel channel { { Data { 0, "x" } } };
  RDTServer server { server_config( 400, false ), channel, server_log_ };

  EXPECT_THROW( server.run( []( string_view ) { FAIL() << "nothing should be delivered"; } ), handshake_error );
  EXPECT_TRUE( channel.sent.empty() );
}

TEST_F( SessionTest, ServerRequiresHandshakeCompletion )
{
  ScriptedChannel channel { { Hello {}, SizeRequest {} } };
  RDTServer server { server_config( 400, false ), channel, server_log_ };

  EXPECT_THROW( server.run( []( string_view ) {} ), handshake_error );
  ASSERT_EQ( channel.sent.size(), 1U );
  EXPECT_TRUE( is<HelloAck>( channel.sent[0] ) );
}

TEST_F( SessionTest, ServerReassemblesAndFinishesOnFin )
{
  ScriptedChannel channel {
    { Hello {}, AckHello {}, SizeRequest {}, Data { 1, "B" }, Data { 0, "A" }, Malformed { "noise" }, Fin {} } };
  RDTServer server { server_config( 400, false ), channel, server_log_ };

  string delivered;
  int deliveries = 0;
  EXPECT_TRUE( server.run( [&]( string_view data ) {
    delivered = data;
    deliveries++;
  } ) );
  EXPECT_EQ( delivered, "AB" );
  EXPECT_EQ( deliveries, 1 );

  ASSERT_EQ( channel.sent.size(), 5U );
  EXPECT_TRUE( is<HelloAck>( channel.sent[0] ) );
  ASSERT_TRUE( is<SizeReply>( channel.sent[1] ) );
  EXPECT_EQ( get<SizeReply>( channel.sent[1] ).max_size, 400U );
  EXPECT_EQ( get<SizeReply>( channel.sent[1] ).adaptive, false );
  EXPECT_EQ( get<CumAck>( channel.sent[2] ).ackno, -1 );
  EXPECT_EQ( get<CumAck>( channel.sent[3] ).ackno, 1 );
  EXPECT_TRUE( is<FinAck>( channel.sent[4] ) );

  EXPECT_NE( server_log_.str().find( "[RECV] Seq 1 -> ack -1" ), string::npos );
  EXPECT_NE( server_log_.str().find( "[RECV] Seq 0 -> ack 1" ), string::npos );
}

TEST_F( SessionTest, ServerHandsUnexpectedNegotiationMessageToTransfer )
{
  ScriptedChannel channel { { Hello {}, AckHello {}, Data { 0, "X" }, Fin {} } };
  RDTServer server { server_config( 400, true ), channel, server_log_ };

  string delivered;
  EXPECT_TRUE( server.run( [&]( string_view data ) { delivered = data; } ) );
  EXPECT_EQ( delivered, "X" );

  ASSERT_EQ( channel.sent.size(), 3U );
  ASSERT_TRUE( is<CumAck>( channel.sent[1] ) );
  EXPECT_EQ( get<CumAck>( channel.sent[1] ).ackno, 0 );
  EXPECT_EQ( get<CumAck>( channel.sent[1] ).max_size, 400U );
}

TEST_F( SessionTest, ServerWithoutFinDeliversNothing )
{
  ScriptedChannel channel { { Hello {}, AckHello {}, SizeRequest {}, Data { 0, "X" } } };
  RDTServer server { server_config( 400, false ), channel, server_log_ };

  bool delivered = false;
  EXPECT_FALSE( server.run( [&]( string_view ) { delivered = true; } ) );
  EXPECT_FALSE( delivered );
}

TEST_F( SessionTest, RejectedServerConfigIsReportedNotThrown )
{
  ScriptedChannel channel { { Hello {}, AckHello {}, SizeRequest {}, Fin {} } };
  RDTConfig cfg = server_config( 400, false );
  cfg.window_size = 0;

  ostringstream errors;
  bool finished = true;
  EXPECT_NO_THROW( finished = serve_connection( channel, cfg, []( string_view ) {}, server_log_, errors ) );
  EXPECT_FALSE( finished );
  EXPECT_NE( errors.str().find( "window size must be positive" ), string::npos );
  EXPECT_TRUE( channel.sent.empty() );
}

TEST_F( SessionTest, NextConnectionIsServedAfterAFailedOne )
{
  ostringstream errors;
  ScriptedChannel bad { { Data { 0, "x" } } };
  EXPECT_FALSE( serve_connection( bad, server_config( 400, false ), []( string_view ) {}, server_log_, errors ) );
  EXPECT_NE( errors.str().find( "Handshake failed" ), string::npos );

  ScriptedChannel good { { Hello {}, AckHello {}, SizeRequest {}, Data { 0, "ok" }, Fin {} } };
  string delivered;
  EXPECT_TRUE( serve_connection(
    good, server_config( 400, false ), [&]( string_view data ) { delivered = data; }, server_log_, errors ) );
  EXPECT_EQ( delivered, "ok" );
}
