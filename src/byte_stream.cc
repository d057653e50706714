#include "byte_stream.hh"

#include <algorithm>

using namespace std;

ByteStream::ByteStream() : pushed_( 0 ), popped_( 0 ), is_closed_( false ), data_() {}

Reader& ByteStream::reader()
{
  return static_cast<Reader&>( *this ); // NOLINT(*-downcast)
}

const Reader& ByteStream::reader() const
{
  return static_cast<const Reader&>( *this ); // NOLINT(*-downcast)
}

Writer& ByteStream::writer()
{
  return static_cast<Writer&>( *this ); // NOLINT(*-downcast)
}

const Writer& ByteStream::writer() const
{
  return static_cast<const Writer&>( *this ); // NOLINT(*-downcast)
}

uint64_t ByteStream::StringQueue::size() const
{
  return data_.size() - popped_;
}

void ByteStream::StringQueue::push( string_view data )
{
  data_.append( data );
}

uint64_t ByteStream::StringQueue::pop( uint64_t len )
{
  const uint64_t bytes_to_pop = std::min( len, data_.size() - popped_ );
  popped_ += bytes_to_pop;

  if ( popped_ >= data_.size() / 2 ) {
    data_ = data_.substr( popped_ );
    popped_ = 0;
  }

  return bytes_to_pop;
}

std::string_view ByteStream::StringQueue::peek() const
{
  return std::string_view { data_ }.substr( popped_ );
}

void Writer::push( string_view data )
{
  if ( is_closed_ ) {
    return;
  }
  data_.push( data );
  pushed_ += data.size();
}

void Writer::close()
{
  is_closed_ = true;
}

bool Writer::is_closed() const
{
  return is_closed_;
}

uint64_t Writer::bytes_pushed() const
{
  return pushed_;
}

string_view Reader::peek() const
{
  return data_.peek();
}

bool Reader::is_finished() const
{
  return is_closed_ && data_.size() == 0;
}

void Reader::pop( uint64_t len )
{
  popped_ += data_.pop( len );
}

uint64_t Reader::bytes_buffered() const
{
  return data_.size();
}

uint64_t Reader::bytes_popped() const
{
  return popped_;
}

string read_all( Reader& reader )
{
  string out { reader.peek() };
  reader.pop( out.size() );
  return out;
}
