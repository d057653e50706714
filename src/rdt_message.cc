#include "rdt_message.hh"

#include "parser.hh"

using namespace std;

namespace {

constexpr string_view FIELD_TYPE = "type";
constexpr string_view FIELD_SEQ = "seq";
constexpr string_view FIELD_PAYLOAD = "payload";
constexpr string_view FIELD_ACK = "ack";
constexpr string_view FIELD_MAX_SIZE = "maximum message size";
constexpr string_view FIELD_ADAPTIVE = "dynamic message size";
constexpr string_view FIELD_REASON = "reason";

constexpr string_view TYPE_HELLO = "SIN";
constexpr string_view TYPE_HELLO_ACK = "SIN/ACK";
constexpr string_view TYPE_ACK = "ACK";
constexpr string_view TYPE_SIZE_REQUEST = "GET_MAX_MSG_SIZE";
constexpr string_view TYPE_SIZE_REPLY = "MAX_MSG_SIZE";
constexpr string_view TYPE_DATA = "DATA";
constexpr string_view TYPE_FIN = "FIN";
constexpr string_view TYPE_FIN_ACK = "FIN_ACK";
constexpr string_view TYPE_ERROR = "ERR";

// A non-negative integer field, or the empty optional if absent or of any other type
optional<uint64_t> unsigned_field( const FieldMap& fields, string_view name )
{
  const auto v = field_as<int64_t>( fields, name );
  if ( not v or *v < 0 ) {
    return nullopt;
  }
  return static_cast<uint64_t>( *v );
}

RDTMessage parse_size_reply( const FieldMap& fields )
{
  SizeReply reply;
  if ( has_field( fields, FIELD_MAX_SIZE ) ) {
    reply.max_size = unsigned_field( fields, FIELD_MAX_SIZE );
    if ( not reply.max_size ) {
      return Malformed { "MAX_MSG_SIZE carries a non-integer size" };
    }
  }
  if ( has_field( fields, FIELD_ADAPTIVE ) ) {
    reply.adaptive = field_as<bool>( fields, FIELD_ADAPTIVE );
    if ( not reply.adaptive ) {
      return Malformed { "MAX_MSG_SIZE carries a non-boolean dynamic flag" };
    }
  }
  return reply;
}

RDTMessage parse_ack( const FieldMap& fields )
{
  if ( not has_field( fields, FIELD_ACK ) ) {
    return AckHello {};
  }

  const auto ackno = field_as<int64_t>( fields, FIELD_ACK );
  if ( not ackno ) {
    return Malformed { "ACK carries a non-integer ack" };
  }
  return CumAck { *ackno, unsigned_field( fields, FIELD_MAX_SIZE ) };
}

RDTMessage parse_data( const FieldMap& fields )
{
  Data data;
  data.seqno = unsigned_field( fields, FIELD_SEQ );
  if ( has_field( fields, FIELD_PAYLOAD ) ) {
    data.payload = field_as<string>( fields, FIELD_PAYLOAD );
  } else {
    data.payload = string {};
  }
  return data;
}

} // namespace

string serialize( const RDTMessage& message )
{
  Serializer s;
  visit( overloaded {
           [&]( const Hello& ) { s.string_field( FIELD_TYPE, TYPE_HELLO ); },
           [&]( const HelloAck& ) { s.string_field( FIELD_TYPE, TYPE_HELLO_ACK ); },
           [&]( const AckHello& ) { s.string_field( FIELD_TYPE, TYPE_ACK ); },
           [&]( const SizeRequest& ) { s.string_field( FIELD_TYPE, TYPE_SIZE_REQUEST ); },
           [&]( const SizeReply& m ) {
             s.string_field( FIELD_TYPE, TYPE_SIZE_REPLY );
             if ( m.max_size ) {
               s.integer_field( FIELD_MAX_SIZE, static_cast<int64_t>( *m.max_size ) );
             }
             if ( m.adaptive ) {
               s.boolean_field( FIELD_ADAPTIVE, *m.adaptive );
             }
           },
           [&]( const Data& m ) {
             s.string_field( FIELD_TYPE, TYPE_DATA );
             if ( m.seqno ) {
               s.integer_field( FIELD_SEQ, static_cast<int64_t>( *m.seqno ) );
             }
             if ( m.payload ) {
               s.string_field( FIELD_PAYLOAD, *m.payload );
             }
           },
           [&]( const CumAck& m ) {
             s.string_field( FIELD_TYPE, TYPE_ACK );
             s.integer_field( FIELD_ACK, m.ackno );
             if ( m.max_size ) {
               s.integer_field( FIELD_MAX_SIZE, static_cast<int64_t>( *m.max_size ) );
             }
           },
           [&]( const Fin& ) { s.string_field( FIELD_TYPE, TYPE_FIN ); },
           [&]( const FinAck& ) { s.string_field( FIELD_TYPE, TYPE_FIN_ACK ); },
           [&]( const Malformed& m ) {
             s.string_field( FIELD_TYPE, TYPE_ERROR );
             s.string_field( FIELD_REASON, m.reason );
           },
         },
         message );
  return s.finish();
}

RDTMessage parse_message( string_view record )
{
  if ( not record.empty() and record.back() == '\r' ) {
    record.remove_suffix( 1 );
  }

  Parser parser { record };
  const auto fields = parser.object();
  if ( not fields ) {
    return Malformed { "bad record: " + parser.error() };
  }

  const auto type = field_as<string>( *fields, FIELD_TYPE );
  if ( not type ) {
    return Malformed { "record has no type" };
  }

  if ( *type == TYPE_HELLO ) {
    return Hello {};
  }
  if ( *type == TYPE_HELLO_ACK ) {
    return HelloAck {};
  }
  if ( *type == TYPE_ACK ) {
    return parse_ack( *fields );
  }
  if ( *type == TYPE_SIZE_REQUEST ) {
    return SizeRequest {};
  }
  if ( *type == TYPE_SIZE_REPLY ) {
    return parse_size_reply( *fields );
  }
  if ( *type == TYPE_DATA ) {
    return parse_data( *fields );
  }
  if ( *type == TYPE_FIN ) {
    return Fin {};
  }
  if ( *type == TYPE_FIN_ACK ) {
    return FinAck {};
  }
  if ( *type == TYPE_ERROR ) {
    return Malformed { field_as<string>( *fields, FIELD_REASON ).value_or( "peer reported an error" ) };
  }
  return Malformed { "unknown message type: " + *type };
}

string summary( const RDTMessage& message )
{
  return visit( overloaded {
                  []( const Hello& ) -> string { return "SIN"; },
                  []( const HelloAck& ) -> string { return "SIN/ACK"; },
                  []( const AckHello& ) -> string { return "ACK"; },
                  []( const SizeRequest& ) -> string { return "GET_MAX_MSG_SIZE"; },
                  []( const SizeReply& m ) -> string {
                    return "MAX_MSG_SIZE size=" + ( m.max_size ? to_string( *m.max_size ) : "(none)" )
                           + " dynamic=" + ( m.adaptive ? ( *m.adaptive ? "true" : "false" ) : "(none)" );
                  },
                  []( const Data& m ) -> string {
                    return "DATA seq=" + ( m.seqno ? to_string( *m.seqno ) : "(none)" )
                           + " len=" + ( m.payload ? to_string( m.payload->size() ) : "(none)" );
                  },
                  []( const CumAck& m ) -> string {
                    return "ACK ack=" + to_string( m.ackno )
                           + ( m.max_size ? " size=" + to_string( *m.max_size ) : string {} );
                  },
                  []( const Fin& ) -> string { return "FIN"; },
                  []( const FinAck& ) -> string { return "FIN_ACK"; },
                  []( const Malformed& m ) -> string { return "ERR " + m.reason; },
                },
                message );
}
