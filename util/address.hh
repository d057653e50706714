#pragma once

#include <cstddef>
#include <cstdint>
#include <netdb.h>
#include <string>
#include <sys/socket.h>
#include <utility>

// Wrapper around IPv4 addresses and DNS operations.
class Address
{
public:
  // Wrapper around [sockaddr_storage](@ref man7::socket).
  // A `sockaddr_storage` is enough space to store any socket address (IPv4 or IPv6).
  class Raw
  {
  public:
    sockaddr_storage storage {}; // The wrapped struct itself.
    // NOLINTBEGIN (*-explicit-*)
    operator sockaddr*();
    operator const sockaddr*() const;
    // NOLINTEND (*-explicit-*)
  };

private:
  socklen_t _size; // Size of the wrapped address.
  Raw _address {}; // A wrapped [sockaddr_storage](@ref man7::socket) containing the address.

  // Constructor from ip/host, service/port, and hints to the resolver.
  Address( const std::string& node, const std::string& service, const addrinfo& hints );

public:
  // Construct by resolving a hostname and servicename.
  Address( const std::string& hostname, const std::string& service );

  // Construct from a [sockaddr *](@ref man7::socket).
  Address( const sockaddr* addr, std::size_t size );

  // Dotted-quad IP address string ("18.243.0.1") and numeric port.
  std::pair<std::string, uint16_t> ip_port() const;
  // Human-readable string, e.g., "8.8.8.8:53".
  std::string to_string() const;

  // Size of the underlying address storage.
  socklen_t size() const { return _size; }
  // Const pointer to the underlying socket address storage.
  const sockaddr* raw() const { return static_cast<const sockaddr*>( _address ); }
};
