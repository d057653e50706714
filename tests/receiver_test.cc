#include "rdt_receiver.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

using namespace std;

TEST( ReceiverTest, OutOfOrderSegmentWaitsForGap )
{
  RDTReceiver receiver { 400, false };

  const CumAck first = receiver.receive( Data { 1, "WORLD" } );
  EXPECT_EQ( first.ackno, -1 );
  EXPECT_FALSE( first.max_size.has_value() );
  EXPECT_EQ( receiver.next_seqno(), 0U );
  EXPECT_TRUE( receiver.reorder_buffer().contains( 1 ) );
  EXPECT_EQ( receiver.delivered(), "" );

  const CumAck second = receiver.receive( Data { 0, "HELLO " } );
  EXPECT_EQ( second.ackno, 1 );
  EXPECT_EQ( receiver.next_seqno(), 2U );
  EXPECT_EQ( receiver.reorder_buffer().segments_pending(), 0U );
  EXPECT_EQ( receiver.delivered(), "HELLO WORLD" );
}

TEST( ReceiverTest, DeliveredDuplicateIsAcknowledgedAndDropped )
{
  RDTReceiver receiver { 400, false };
  receiver.receive( Data { 0, "A" } );
  receiver.receive( Data { 1, "B" } );

  const CumAck ack = receiver.receive( Data { 0, "changed" } );
  EXPECT_EQ( ack.ackno, 1 );
  EXPECT_EQ( receiver.next_seqno(), 2U );
  EXPECT_EQ( receiver.delivered(), "AB" );
}

TEST( ReceiverTest, RejectedSegmentsStillAcknowledged )
{
  RDTReceiver receiver { 10, false };
  receiver.receive( Data { 0, "ok" } );

  EXPECT_EQ( receiver.receive( Data { 1, string( 11, 'x' ) } ).ackno, 0 );
  EXPECT_EQ( receiver.receive( Data { nullopt, "x" } ).ackno, 0 );
  EXPECT_EQ( receiver.receive( Data { 1, nullopt } ).ackno, 0 );
  EXPECT_EQ( receiver.reorder_buffer().segments_pending(), 0U );
  EXPECT_EQ( receiver.delivered(), "ok" );

  // exactly the maximum is accepted
  EXPECT_EQ( receiver.receive( Data { 1, string( 10, 'y' ) } ).ackno, 1 );
}

TEST( ReceiverTest, BacklogShrinksSegmentSize )
{
  RDTReceiver receiver { 400, true };

  EXPECT_EQ( receiver.receive( Data { 1, "b" } ).max_size, 400U );
  EXPECT_EQ( receiver.receive( Data { 2, "c" } ).max_size, 400U );

  const CumAck ack = receiver.receive( Data { 3, "d" } );
  EXPECT_EQ( ack.ackno, -1 );
  EXPECT_EQ( ack.max_size, 380U );
  EXPECT_EQ( receiver.receive( Data { 4, "e" } ).max_size, 360U );

  // the gap fills, everything drains and the size recovers by the smaller step
  const CumAck drained = receiver.receive( Data { 0, "a" } );
  EXPECT_EQ( drained.ackno, 4 );
  EXPECT_EQ( drained.max_size, 370U );
  EXPECT_EQ( receiver.delivered(), "abcde" );
}

TEST( ReceiverTest, ShrinkIsFlooredAndGrowthCapped )
{
  RDTReceiver receiver { 30, true };
  receiver.receive( Data { 1, "b" } );
  receiver.receive( Data { 2, "c" } );
  EXPECT_EQ( receiver.receive( Data { 3, "d" } ).max_size, 20U );
  EXPECT_EQ( receiver.receive( Data { 4, "e" } ).max_size, 20U );

  receiver.receive( Data { 0, "a" } );
  EXPECT_EQ( receiver.max_segment(), 30U );
  EXPECT_EQ( receiver.receive( Data { 5, "f" } ).max_size, 30U );
}

TEST( ReceiverTest, RejectedSegmentDoesNotAdapt )
{
  RDTReceiver receiver { 30, true };
  receiver.receive( Data { 1, "b" } );
  receiver.receive( Data { 2, "c" } );
  receiver.receive( Data { 3, "d" } );
  ASSERT_EQ( receiver.max_segment(), 20U );

  EXPECT_EQ( receiver.receive( Data { 4, string( 25, 'x' ) } ).max_size, 20U );
  EXPECT_EQ( receiver.reorder_buffer().segments_pending(), 3U );
}

TEST( ReceiverTest, AnyArrivalOrderReassemblesSource )
{
  vector<string> segments;
  string source;
  for ( int i = 0; i < 40; i++ ) {
    segments.push_back( "seg" + to_string( i ) + ";" );
    source += segments.back();
  }

  mt19937 rng { 2024 };
  for ( int trial = 0; trial < 20; trial++ ) {
    // every segment at least once, some several times, in random order
    vector<uint64_t> arrivals;
    for ( uint64_t i = 0; i < segments.size(); i++ ) {
      arrivals.push_back( i );
      if ( rng() % 3 == 0 ) {
        arrivals.push_back( i );
      }
    }
    shuffle( arrivals.begin(), arrivals.end(), rng );

    RDTReceiver receiver { 400, false };
    int64_t last_ack = -1;
    for ( const uint64_t seqno : arrivals ) {
      const CumAck ack = receiver.receive( Data { seqno, segments[seqno] } );
      ASSERT_GE( ack.ackno, last_ack );
      last_ack = ack.ackno;

      // the delivered prefix always matches the source
      ASSERT_EQ( source.substr( 0, receiver.delivered().size() ), receiver.delivered() );
    }
    EXPECT_EQ( receiver.delivered(), source );
    EXPECT_EQ( last_ack, 39 );
  }
}
