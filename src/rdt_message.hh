#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Handshake: client -> server
struct Hello
{};

// Handshake: server -> client
struct HelloAck
{};

// Handshake completion: client -> server
struct AckHello
{};

// Negotiation request: client -> server
struct SizeRequest
{};

// Negotiation reply: server -> client
struct SizeReply
{
  std::optional<uint64_t> max_size {};
  std::optional<bool> adaptive {};
};

// One segment of the sender's source data. Either field may be absent when decoded from a bad record.
struct Data
{
  std::optional<uint64_t> seqno {};
  std::optional<std::string> payload {};
};

// Cumulative acknowledgment: every segment up to and including `ackno` has arrived.
// `ackno` is -1 while nothing has been delivered.
struct CumAck
{
  int64_t ackno {};
  std::optional<uint64_t> max_size {};
};

struct Fin
{};

struct FinAck
{};

// A record that could not be understood
struct Malformed
{
  std::string reason {};
};

using RDTMessage = std::variant<Hello, HelloAck, AckHello, SizeRequest, SizeReply, Data, CumAck, Fin, FinAck, Malformed>;

// Helper for std::visit over RDTMessage with one lambda per alternative
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};

// Encode as one line of text terminated by '\n'
std::string serialize( const RDTMessage& message );

// Decode one record (without its line terminator). Never throws: bad records decode to Malformed.
RDTMessage parse_message( std::string_view record );

// Short human-readable description, e.g. "DATA seq=3 len=10"
std::string summary( const RDTMessage& message );
