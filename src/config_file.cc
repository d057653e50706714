#include "config_file.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string_view>

using namespace std;

namespace {

string_view trim( string_view s )
{
  while ( not s.empty() and isspace( static_cast<unsigned char>( s.front() ) ) ) {
    s.remove_prefix( 1 );
  }
  while ( not s.empty() and isspace( static_cast<unsigned char>( s.back() ) ) ) {
    s.remove_suffix( 1 );
  }
  return s;
}

string normalize_key( string_view key )
{
  string out;
  for ( const char c : trim( key ) ) {
    if ( c == ' ' or c == '-' ) {
      out.push_back( '_' );
    } else {
      out.push_back( static_cast<char>( tolower( static_cast<unsigned char>( c ) ) ) );
    }
  }
  return out;
}

string strip_quotes( string_view value )
{
  string out;
  for ( const char c : trim( value ) ) {
    if ( c != '"' ) {
      out.push_back( c );
    }
  }
  return string { trim( out ) };
}

optional<uint64_t> parse_unsigned( string_view text )
{
  uint64_t result {};
  const auto [ptr, ec] = from_chars( text.data(), text.data() + text.size(), result );
  if ( ec != errc {} or ptr != text.data() + text.size() ) {
    return nullopt;
  }
  return result;
}

// Seconds (possibly fractional) to whole milliseconds
optional<uint64_t> parse_seconds( const string& text )
{
  if ( text.empty() ) {
    return nullopt;
  }
  char* end = nullptr;
  const double seconds = strtod( text.c_str(), &end );
  if ( end != text.c_str() + text.size() or not isfinite( seconds ) or seconds < 0 ) {
    return nullopt;
  }
  return static_cast<uint64_t>( llround( seconds * 1000 ) );
}

optional<bool> parse_flag( string_view text )
{
  string lowered;
  for ( const char c : text ) {
    lowered.push_back( static_cast<char>( tolower( static_cast<unsigned char>( c ) ) ) );
  }
  if ( lowered == "true" ) {
    return true;
  }
  if ( lowered == "false" ) {
    return false;
  }
  return nullopt;
}

enum class Key
{
  MaxMessageSize,
  WindowSize,
  Adaptive,
  Timeout,
  Message,
  Unknown
};

Key classify( const string& key )
{
  static constexpr array<string_view, 5> max_size_keys {
    "maximum_msg_size", "maximum_message_size", "maximum", "mss", "max_msg_size" };
  static constexpr array<string_view, 3> adaptive_keys { "dynamic_message_size", "dynamic", "dynamic_msg_size" };
  static constexpr array<string_view, 3> message_keys { "message", "message_file", "message_path" };

  const auto in = [&]( const auto& keys ) { return ranges::find( keys, string_view { key } ) != keys.end(); };

  if ( in( max_size_keys ) ) {
    return Key::MaxMessageSize;
  }
  if ( key == "window_size" or key == "window" ) {
    return Key::WindowSize;
  }
  if ( in( adaptive_keys ) ) {
    return Key::Adaptive;
  }
  if ( key == "timeout" or key == "time_out" ) {
    return Key::Timeout;
  }
  if ( in( message_keys ) ) {
    return Key::Message;
  }
  return Key::Unknown;
}

// Apply one value; false if it does not parse
bool apply( Key key, const string& value, RDTConfig& cfg )
{
  switch ( key ) {
    case Key::MaxMessageSize:
      if ( const auto v = parse_unsigned( value ) ) {
        cfg.max_message_size = *v;
        return true;
      }
      return false;
    case Key::WindowSize:
      if ( const auto v = parse_unsigned( value ) ) {
        cfg.window_size = *v;
        return true;
      }
      return false;
    case Key::Adaptive:
      if ( const auto v = parse_flag( value ) ) {
        cfg.adaptive_sizing = *v;
        return true;
      }
      return false;
    case Key::Timeout:
      if ( const auto v = parse_seconds( value ) ) {
        cfg.timeout_ms = *v;
        return true;
      }
      return false;
    case Key::Message:
      cfg.message_path = value;
      return true;
    case Key::Unknown:
      break;
  }
  return true;
}

} // namespace

void parse_config( istream& in, RDTConfig& cfg, ostream& diagnostics )
{
  string line;
  while ( getline( in, line ) ) {
    const auto colon = line.find( ':' );
    if ( colon == string::npos ) {
      continue;
    }

    // split only on the first ':' so that values may contain one (e.g. paths)
    const string key = normalize_key( string_view { line }.substr( 0, colon ) );
    const string value = strip_quotes( string_view { line }.substr( colon + 1 ) );

    if ( not apply( classify( key ), value, cfg ) ) {
      diagnostics << "Ignoring invalid value for " << key << ": \"" << value << "\"\n";
    }
  }
}

optional<RDTConfig> load_config_file( const string& path, ostream& diagnostics )
{
  ifstream file { path };
  if ( not file.is_open() ) {
    return nullopt;
  }

  RDTConfig cfg;
  parse_config( file, cfg, diagnostics );
  return cfg;
}

RDTConfig prompt_config( Role role, istream& in, ostream& out )
{
  RDTConfig cfg;

  const auto ask = [&]( string_view question, Key key ) {
    out << question << flush;
    string answer;
    if ( not getline( in, answer ) ) {
      return;
    }
    answer = strip_quotes( answer );
    if ( not answer.empty() and not apply( key, answer, cfg ) ) {
      out << "Invalid value \"" << answer << "\"; keeping the default.\n";
    }
  };

  if ( role == Role::Client ) {
    ask( "Enter message file path (default 'message.txt'): ", Key::Message );
    ask( "Enter window size (default 4): ", Key::WindowSize );
    ask( "Enter timeout in seconds (default 5.0): ", Key::Timeout );
  } else {
    ask( "Enter maximum message size (default 400): ", Key::MaxMessageSize );
    ask( "Enter window size (default 4): ", Key::WindowSize );
    ask( "Dynamic message size? (true/false, default false): ", Key::Adaptive );
  }
  return cfg;
}
