#pragma once

#include <cstdint>
#include <string>
#include <string_view>

class Reader;
class Writer;

// An in-memory stream of bytes with a writing end and a reading end.
// Unlike a pipe, the stream is unbounded: every pushed byte is kept until it is popped.
class ByteStream
{
protected:
  class StringQueue
  {
    std::string data_ {};
    uint64_t popped_ {};

  public:
    uint64_t size() const;
    void push( std::string_view data );
    uint64_t pop( uint64_t len );
    std::string_view peek() const;
  };

  uint64_t pushed_;
  uint64_t popped_;
  bool is_closed_;
  StringQueue data_;

public:
  ByteStream();

  // Helper functions (provided) to access the ByteStream's Reader and Writer interfaces
  Reader& reader();
  const Reader& reader() const;
  Writer& writer();
  const Writer& writer() const;
};

class Writer : public ByteStream
{
public:
  void push( std::string_view data ); // Push data to stream
  void close();                       // Signal that the stream has reached its ending. Nothing more will be written.

  bool is_closed() const;       // Has the stream been closed?
  uint64_t bytes_pushed() const; // Total number of bytes cumulatively pushed to the stream
};

class Reader : public ByteStream
{
public:
  std::string_view peek() const; // Peek at the next bytes in the buffer
  void pop( uint64_t len );      // Remove `len` bytes from the buffer

  bool is_finished() const;        // Is the stream finished (closed and fully popped)?
  uint64_t bytes_buffered() const; // Number of bytes currently buffered (pushed and not popped)
  uint64_t bytes_popped() const;   // Total number of bytes cumulatively popped from stream
};

static_assert( sizeof( Reader ) == sizeof( ByteStream ),
               "Please add member variables to the ByteStream base, not the ByteStream Reader." );

static_assert( sizeof( Writer ) == sizeof( ByteStream ),
               "Please add member variables to the ByteStream base, not the ByteStream Writer." );

// Pop everything the reader currently has buffered and return it
std::string read_all( Reader& reader );
