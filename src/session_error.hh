#pragma once

#include <stdexcept>
#include <string>

// The handshake or the parameter negotiation did not complete; the session is abandoned
class handshake_error : public std::runtime_error
{
public:
  explicit handshake_error( const std::string& what ) : std::runtime_error( what ) {}
};

// The peer closed the connection while data was still unacknowledged
class connection_closed_error : public std::runtime_error
{
public:
  explicit connection_closed_error( const std::string& what ) : std::runtime_error( what ) {}
};
