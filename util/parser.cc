#include "parser.hh"

#include <cctype>
#include <charconv>
#include <cstdlib>

using namespace std;

void Parser::set_error( std::string reason )
{
  if ( error_.empty() ) {
    error_ = move( reason );
  }
}

void Parser::skip_whitespace()
{
  while ( pos_ < input_.size()
          and ( input_[pos_] == ' ' or input_[pos_] == '\t' or input_[pos_] == '\r' or input_[pos_] == '\n' ) ) {
    ++pos_;
  }
}

bool Parser::consume( char expected )
{
  skip_whitespace();
  if ( pos_ < input_.size() and input_[pos_] == expected ) {
    ++pos_;
    return true;
  }
  return false;
}

optional<uint32_t> Parser::hex4()
{
  if ( input_.size() - pos_ < 4 ) {
    set_error( "truncated \\u escape" );
    return {};
  }
  uint32_t code {};
  const auto* first = input_.data() + pos_;
  const auto [ptr, ec] = from_chars( first, first + 4, code, 16 );
  if ( ec != errc {} or ptr != first + 4 ) {
    set_error( "bad \\u escape" );
    return {};
  }
  pos_ += 4;
  return code;
}

static void append_utf8( string& out, uint32_t code )
{
  if ( code < 0x80 ) {
    out.push_back( static_cast<char>( code ) );
  } else if ( code < 0x800 ) {
    out.push_back( static_cast<char>( 0xC0 | ( code >> 6 ) ) );
    out.push_back( static_cast<char>( 0x80 | ( code & 0x3F ) ) );
  } else if ( code < 0x10000 ) {
    out.push_back( static_cast<char>( 0xE0 | ( code >> 12 ) ) );
    out.push_back( static_cast<char>( 0x80 | ( ( code >> 6 ) & 0x3F ) ) );
    out.push_back( static_cast<char>( 0x80 | ( code & 0x3F ) ) );
  } else {
    out.push_back( static_cast<char>( 0xF0 | ( code >> 18 ) ) );
    out.push_back( static_cast<char>( 0x80 | ( ( code >> 12 ) & 0x3F ) ) );
    out.push_back( static_cast<char>( 0x80 | ( ( code >> 6 ) & 0x3F ) ) );
    out.push_back( static_cast<char>( 0x80 | ( code & 0x3F ) ) );
  }
}

optional<string> Parser::string_literal()
{
  if ( not consume( '"' ) ) {
    set_error( "expected string" );
    return {};
  }

  std::string out;
  while ( pos_ < input_.size() ) {
    const char c = input_[pos_++];
    if ( c == '"' ) {
      return out;
    }
    if ( static_cast<unsigned char>( c ) < 0x20 ) {
      set_error( "control character in string" );
      return {};
    }
    if ( c != '\\' ) {
      out.push_back( c );
      continue;
    }
    if ( pos_ >= input_.size() ) {
      break;
    }
    switch ( const char escape = input_[pos_++] ) {
      case '"':
      case '\\':
      case '/':
        out.push_back( escape );
        break;
      case 'b':
        out.push_back( '\b' );
        break;
      case 'f':
        out.push_back( '\f' );
        break;
      case 'n':
        out.push_back( '\n' );
        break;
      case 'r':
        out.push_back( '\r' );
        break;
      case 't':
        out.push_back( '\t' );
        break;
      case 'u': {
        auto code = hex4();
        if ( not code ) {
          return {};
        }
        // a high surrogate must be followed by an escaped low surrogate
        if ( *code >= 0xD800 and *code < 0xDC00 ) {
          if ( input_.substr( pos_, 2 ) != "\\u" ) {
            set_error( "unpaired surrogate" );
            return {};
          }
          pos_ += 2;
          const auto low = hex4();
          if ( not low or *low < 0xDC00 or *low >= 0xE000 ) {
            set_error( "unpaired surrogate" );
            return {};
          }
          code = 0x10000 + ( ( *code - 0xD800 ) << 10 ) + ( *low - 0xDC00 );
        } else if ( *code >= 0xDC00 and *code < 0xE000 ) {
          set_error( "unpaired surrogate" );
          return {};
        }
        append_utf8( out, *code );
        break;
      }
      default:
        set_error( "bad escape" );
        return {};
    }
  }

  set_error( "unterminated string" );
  return {};
}

optional<Value> Parser::number()
{
  const size_t start = pos_;
  bool integral = true;

  if ( pos_ < input_.size() and input_[pos_] == '-' ) {
    ++pos_;
  }
  const size_t digits_start = pos_;
  while ( pos_ < input_.size() and isdigit( static_cast<unsigned char>( input_[pos_] ) ) ) {
    ++pos_;
  }
  if ( pos_ == digits_start ) {
    set_error( "bad number" );
    return {};
  }
  if ( pos_ < input_.size() and input_[pos_] == '.' ) {
    integral = false;
    ++pos_;
    while ( pos_ < input_.size() and isdigit( static_cast<unsigned char>( input_[pos_] ) ) ) {
      ++pos_;
    }
  }
  if ( pos_ < input_.size() and ( input_[pos_] == 'e' or input_[pos_] == 'E' ) ) {
    integral = false;
    ++pos_;
    if ( pos_ < input_.size() and ( input_[pos_] == '+' or input_[pos_] == '-' ) ) {
      ++pos_;
    }
    while ( pos_ < input_.size() and isdigit( static_cast<unsigned char>( input_[pos_] ) ) ) {
      ++pos_;
    }
  }

  const string_view text = input_.substr( start, pos_ - start );
  if ( integral ) {
    int64_t result {};
    const auto [ptr, ec] = from_chars( text.data(), text.data() + text.size(), result );
    if ( ec == errc {} and ptr == text.data() + text.size() ) {
      return Value { result };
    }
    // out of int64 range: fall through and keep it as a floating-point number
  }

  const std::string copy { text };
  char* end = nullptr;
  const double result = strtod( copy.c_str(), &end );
  if ( end != copy.c_str() + copy.size() ) {
    set_error( "bad number" );
    return {};
  }
  return Value { result };
}

optional<Value> Parser::literal()
{
  const auto matches = [&]( string_view word ) {
    if ( input_.substr( pos_, word.size() ) == word ) {
      pos_ += word.size();
      return true;
    }
    return false;
  };

  if ( matches( "true" ) ) {
    return Value { true };
  }
  if ( matches( "false" ) ) {
    return Value { false };
  }
  if ( matches( "null" ) ) {
    return Value { monostate {} };
  }
  set_error( "unexpected token" );
  return {};
}

optional<Value> Parser::value()
{
  skip_whitespace();
  if ( pos_ >= input_.size() ) {
    set_error( "missing value" );
    return {};
  }

  const char c = input_[pos_];
  if ( c == '"' ) {
    auto s = string_literal();
    if ( not s ) {
      return {};
    }
    return Value { move( *s ) };
  }
  if ( c == '-' or isdigit( static_cast<unsigned char>( c ) ) ) {
    return number();
  }
  if ( c == '{' or c == '[' ) {
    set_error( "nested values are not supported" );
    return {};
  }
  return literal();
}

optional<FieldMap> Parser::object()
{
  if ( not consume( '{' ) ) {
    set_error( "expected object" );
    return {};
  }

  FieldMap fields;
  if ( not consume( '}' ) ) {
    do {
      auto name = string_literal();
      if ( not name ) {
        return {};
      }
      if ( not consume( ':' ) ) {
        set_error( "expected ':'" );
        return {};
      }
      auto v = value();
      if ( not v ) {
        return {};
      }
      fields.insert_or_assign( move( *name ), move( *v ) );
    } while ( consume( ',' ) );

    if ( not consume( '}' ) ) {
      set_error( "expected '}'" );
      return {};
    }
  }

  skip_whitespace();
  if ( pos_ != input_.size() ) {
    set_error( "trailing characters after object" );
    return {};
  }
  return fields;
}

void Serializer::key( string_view name )
{
  if ( not empty_ ) {
    output_.push_back( ',' );
  }
  empty_ = false;
  quote( name );
  output_.push_back( ':' );
}

void Serializer::quote( string_view text )
{
  static constexpr string_view hex_digits = "0123456789abcdef";

  output_.push_back( '"' );
  for ( const char c : text ) {
    switch ( c ) {
      case '"':
        output_.append( "\\\"" );
        break;
      case '\\':
        output_.append( "\\\\" );
        break;
      case '\n':
        output_.append( "\\n" );
        break;
      case '\r':
        output_.append( "\\r" );
        break;
      case '\t':
        output_.append( "\\t" );
        break;
      default:
        if ( static_cast<unsigned char>( c ) < 0x20 ) {
          output_.append( "\\u00" );
          output_.push_back( hex_digits[( c >> 4 ) & 0xF] );
          output_.push_back( hex_digits[c & 0xF] );
        } else {
          output_.push_back( c );
        }
    }
  }
  output_.push_back( '"' );
}

void Serializer::string_field( string_view name, string_view value )
{
  key( name );
  quote( value );
}

void Serializer::integer_field( string_view name, int64_t value )
{
  key( name );
  output_.append( to_string( value ) );
}

void Serializer::boolean_field( string_view name, bool value )
{
  key( name );
  output_.append( value ? "true" : "false" );
}

string Serializer::finish()
{
  output_.append( "}\n" );
  return move( output_ );
}
