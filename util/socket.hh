#pragma once

#include "address.hh"
#include "file_descriptor.hh"

#include <functional>
#include <netinet/in.h>
#include <sys/socket.h>
#include <utility>

// Base class for network sockets (TCP, UDP, etc.)
// Socket is generally used via a subclass. See TCPSocket for an example.
class Socket : public FileDescriptor
{
private:
  // Get the local or peer address the socket is connected to
  Address get_address( const std::string& name_of_function,
                       const std::function<int( int, sockaddr*, socklen_t* )>& function ) const;

protected:
  // Construct via [socket(2)](\ref man2::socket)
  Socket( int domain, int type, int protocol = 0 );

  // Construct from a file descriptor.
  Socket( FileDescriptor&& fd, int domain, int type, int protocol = 0 );

  // Wrapper around [setsockopt(2)](\ref man2::setsockopt)
  template<typename option_type>
  void setsockopt( int level, int option, const option_type& option_value );

public:
  // Bind a socket to a specified address with [bind(2)](\ref man2::bind), usually for listen/accept
  void bind( const Address& address );

  // Connect a socket to a specified peer address with [connect(2)](\ref man2::connect)
  void connect( const Address& address );

  // Get local address of socket with [getsockname(2)](\ref man2::getsockname)
  Address local_address() const;
  // Get peer address of socket with [getpeername(2)](\ref man2::getpeername)
  Address peer_address() const;

  // Allow local address to be reused sooner via [SO_REUSEADDR](\ref man7::socket)
  void set_reuseaddr();
};

// A wrapper around [TCP sockets](\ref man7::tcp)
class TCPSocket : public Socket
{
private:
  // Construct from FileDescriptor (used by accept())
  explicit TCPSocket( FileDescriptor&& fd ) : Socket( std::move( fd ), AF_INET, SOCK_STREAM, IPPROTO_TCP ) {}

public:
  // Default: construct an unbound, unconnected TCP socket
  TCPSocket() : Socket( AF_INET, SOCK_STREAM ) {}

  // Mark a socket as listening for incoming connections
  void listen( int backlog = 16 );

  // Accept a new incoming connection
  TCPSocket accept();
};

// A connected pair of local stream sockets, from [socketpair(2)](\ref man2::socketpair)
std::pair<FileDescriptor, FileDescriptor> socket_pair_helper( int type = SOCK_STREAM );
