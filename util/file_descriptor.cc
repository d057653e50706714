#include "file_descriptor.hh"

#include "exception.hh"

#include <algorithm>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace std;

template<typename T>
T FileDescriptor::FDWrapper::CheckSystemCall( string_view s_attempt, T return_value ) const
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  if ( non_blocking_ and ( errno == EAGAIN or errno == EINPROGRESS ) ) {
    return 0;
  }

  throw unix_error { s_attempt };
}

template<typename T>
T FileDescriptor::CheckSystemCall( string_view s_attempt, T return_value ) const
{
  if ( not internal_fd_ ) {
    throw runtime_error( "internal error: missing internal_fd_" );
  }
  return internal_fd_->CheckSystemCall( s_attempt, return_value );
}

// fd is the file descriptor number returned by [open(2)](\ref man2::open) or similar
FileDescriptor::FDWrapper::FDWrapper( int fd ) : fd_( fd )
{
  if ( fd < 0 ) {
    throw runtime_error( "invalid fd number:" + to_string( fd ) );
  }

  const int flags = CheckSystemCall( "fcntl", fcntl( fd, F_GETFL ) ); // NOLINT(*-vararg)
  non_blocking_ = flags & O_NONBLOCK;                                  // NOLINT(*-bitwise)
}

void FileDescriptor::FDWrapper::close()
{
  CheckSystemCall( "close", ::close( fd_ ) );
  eof_ = closed_ = true;
}

FileDescriptor::FDWrapper::~FDWrapper()
{
  try {
    if ( closed_ ) {
      return;
    }
    close();
  } catch ( const exception& e ) {
    // don't throw an exception from the destructor
    cerr << "Exception destructing FDWrapper: " << e.what() << "\n";
  }
}

// fd is the file descriptor number returned by [open(2)](\ref man2::open) or similar
FileDescriptor::FileDescriptor( int fd ) : internal_fd_( make_shared<FDWrapper>( fd ) ) {}

void FileDescriptor::read( string& buffer )
{
  buffer.resize( kReadBufferSize );

  const ssize_t bytes_read = ::read( fd_num(), buffer.data(), buffer.size() );
  if ( bytes_read < 0 ) {
    if ( internal_fd_->non_blocking_ and ( errno == EAGAIN or errno == EINPROGRESS ) ) {
      buffer.clear();
      return;
    }
    throw unix_error { "read" };
  }

  if ( bytes_read == 0 ) {
    internal_fd_->eof_ = true;
  }

  buffer.resize( bytes_read );
}

size_t FileDescriptor::write( string_view buffer )
{
  const ssize_t bytes_written = CheckSystemCall( "write", ::write( fd_num(), buffer.data(), buffer.size() ) );

  if ( bytes_written == 0 and not buffer.empty() ) {
    throw runtime_error( "write returned 0 given non-empty input buffer" );
  }

  if ( bytes_written > static_cast<ssize_t>( buffer.size() ) ) {
    throw runtime_error( "write wrote more than length of input buffer" );
  }

  return bytes_written;
}

void FileDescriptor::write_all( string_view buffer )
{
  while ( not buffer.empty() ) {
    buffer.remove_prefix( write( buffer ) );
  }
}

template int FileDescriptor::CheckSystemCall( string_view, int ) const;
template ssize_t FileDescriptor::CheckSystemCall( string_view, ssize_t ) const;
