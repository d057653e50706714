#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// A scalar JSON value: null, boolean, integer, floating-point number, or string
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

// The fields of one flat JSON object, by name
using FieldMap = std::map<std::string, Value, std::less<>>;

// Reads one flat JSON object (scalar values only) out of a text record.
class Parser
{
  std::string_view input_;
  size_t pos_ {};
  std::string error_ {};

  void skip_whitespace();
  bool consume( char expected );
  std::optional<std::string> string_literal();
  std::optional<uint32_t> hex4();
  std::optional<Value> number();
  std::optional<Value> literal();
  std::optional<Value> value();

public:
  explicit Parser( std::string_view input ) : input_( input ) {}

  // Parse the whole input as one object; returns the empty optional (and records why) on any error
  std::optional<FieldMap> object();

  void set_error( std::string reason );
  const std::string& error() const { return error_; }
};

// Writes one flat JSON object as a single line terminated by '\n'.
class Serializer
{
  std::string output_ { "{" };
  bool empty_ { true };

  void key( std::string_view name );
  void quote( std::string_view text );

public:
  void string_field( std::string_view name, std::string_view value );
  void integer_field( std::string_view name, int64_t value );
  void boolean_field( std::string_view name, bool value );

  // Close the object and return the finished record
  std::string finish();
};

// Field accessors that return the empty optional when the field is absent or of another type
template<typename T>
std::optional<T> field_as( const FieldMap& fields, std::string_view name )
{
  const auto it = fields.find( name );
  if ( it == fields.end() ) {
    return std::nullopt;
  }
  if ( const T* v = std::get_if<T>( &it->second ) ) {
    return *v;
  }
  return std::nullopt;
}

inline bool has_field( const FieldMap& fields, std::string_view name )
{
  return fields.find( name ) != fields.end();
}
