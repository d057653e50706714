#include "byte_stream.hh"
#include "reorder_buffer.hh"

#include <gtest/gtest.h>

using namespace std;

TEST( ByteStreamTest, PushPeekPop )
{
  ByteStream stream;
  stream.writer().push( "hello " );
  stream.writer().push( "world" );
  EXPECT_EQ( stream.writer().bytes_pushed(), 11U );
  EXPECT_EQ( stream.reader().peek(), "hello world" );

  stream.reader().pop( 6 );
  EXPECT_EQ( stream.reader().peek(), "world" );
  EXPECT_EQ( stream.reader().bytes_popped(), 6U );
  EXPECT_EQ( stream.reader().bytes_buffered(), 5U );
  EXPECT_FALSE( stream.reader().is_finished() );

  stream.writer().close();
  stream.writer().push( "ignored" );
  EXPECT_EQ( read_all( stream.reader() ), "world" );
  EXPECT_TRUE( stream.reader().is_finished() );
}

TEST( ReorderBufferTest, InOrderWritesImmediately )
{
  ByteStream output;
  ReorderBuffer buffer;

  buffer.insert( 0, "a", output.writer() );
  buffer.insert( 1, "b", output.writer() );
  EXPECT_EQ( buffer.next_seqno(), 2U );
  EXPECT_EQ( buffer.segments_pending(), 0U );
  EXPECT_EQ( output.reader().peek(), "ab" );
}

TEST( ReorderBufferTest, DrainsContiguousRunOnly )
{
  ByteStream output;
  ReorderBuffer buffer;

  buffer.insert( 2, "c", output.writer() );
  buffer.insert( 1, "b", output.writer() );
  buffer.insert( 4, "e", output.writer() );
  EXPECT_EQ( buffer.segments_pending(), 3U );
  EXPECT_EQ( output.reader().peek(), "" );

  buffer.insert( 0, "a", output.writer() );
  EXPECT_EQ( output.reader().peek(), "abc" );
  EXPECT_EQ( buffer.next_seqno(), 3U );
  EXPECT_EQ( buffer.segments_pending(), 1U );
  EXPECT_TRUE( buffer.contains( 4 ) );
}

TEST( ReorderBufferTest, OldSegmentsIgnoredAndPendingOverwritten )
{
  ByteStream output;
  ReorderBuffer buffer;

  buffer.insert( 0, "a", output.writer() );
  buffer.insert( 0, "z", output.writer() );
  EXPECT_EQ( output.reader().peek(), "a" );

  buffer.insert( 2, "old", output.writer() );
  buffer.insert( 2, "new", output.writer() );
  EXPECT_EQ( buffer.segments_pending(), 1U );
  buffer.insert( 1, "b", output.writer() );
  EXPECT_EQ( output.reader().peek(), "abnew" );
}
