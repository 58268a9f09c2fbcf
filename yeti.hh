// ╻ ╻┏━╸╺┳╸╻
// ┗┳┛┣╸  ┃ ┃
//  ╹ ┗━╸ ╹ ╹
//  YAML Emitter for Tree Inputs
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace yeti {

  // Failure categories reported through yeti::Error
  enum class ErrorKind {
    InvalidInputKind, // Tree handed to the mapping encoder is not a mapping
    UnsupportedKeyType, // Mapping key is neither text nor a symbol
    EmptyMappingInSequence, // Sequence item is a mapping with no entries
    InvalidDepth, // Negative nesting depth
    InvalidIndentConfig, // Indentation unit is empty or width is not positive
    UnsupportedNode // Document node with no tree representation
  };

  inline const char* error_kind_name( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::InvalidInputKind: return "InvalidInputKind";
      case ErrorKind::UnsupportedKeyType: return "UnsupportedKeyType";
      case ErrorKind::EmptyMappingInSequence: return "EmptyMappingInSequence";
      case ErrorKind::InvalidDepth: return "InvalidDepth";
      case ErrorKind::InvalidIndentConfig: return "InvalidIndentConfig";
      case ErrorKind::UnsupportedNode: return "UnsupportedNode";
    }
    return "Unknown";
  }

  class Error : public std::runtime_error {
  public:
    Error( ErrorKind kind, const std::string& msg )
      : std::runtime_error( msg ), kind_( kind ) {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
  };

  // Symbolic identifier, usable both as a mapping key and as a scalar value.
  // Rendered by name, never quoted.
  struct Symbol {
    std::string name;
  };

namespace internal {

  // Character types are text, not numbers
  template < typename T >
  inline constexpr bool is_char_like_v =
    std::is_same_v< T, char > || std::is_same_v< T, signed char > ||
    std::is_same_v< T, unsigned char > || std::is_same_v< T, wchar_t > ||
    std::is_same_v< T, char16_t > || std::is_same_v< T, char32_t >;

  template < typename T >
  inline constexpr bool is_numeric_v = std::is_arithmetic_v< T >
    && !std::is_same_v< T, bool > && !is_char_like_v< T >;

  // Character types other than plain char are rejected outright
  template < typename T >
  inline constexpr bool is_rejected_char_v =
    is_char_like_v< T > && !std::is_same_v< T, char >;

} // namespace yeti::internal

  // Integer or floating-point scalar. Unsigned values above INT64_MAX are
  // kept unsigned.
  class Number {
  public:
    template < typename T, std::enable_if_t<
      internal::is_numeric_v< T > && std::is_integral_v< T >, int > = 0 >
    Number( T value ) {
      if constexpr ( std::is_unsigned_v< T > ) {
        if ( static_cast< std::uint64_t >( value ) >
          static_cast< std::uint64_t >( INT64_MAX ) )
        {
          rep_ = static_cast< std::uint64_t >( value );
          return;
        }
      }
      rep_ = static_cast< std::int64_t >( value );
    }

    template < typename T, std::enable_if_t<
      std::is_floating_point_v< T >, int > = 0 >
    Number( T value ) : rep_( static_cast< double >( value ) ) {}

    bool is_integer() const { return rep_.index() != 2; }
    bool is_unsigned() const { return rep_.index() == 1; }
    std::int64_t as_integer() const { return std::get< std::int64_t >( rep_ ); }
    std::uint64_t as_unsigned() const {
      return std::get< std::uint64_t >( rep_ );
    }
    double as_float() const { return std::get< double >( rep_ ); }

  private:
    std::variant< std::int64_t, std::uint64_t, double > rep_;
  };

  // Mapping key. Only text and symbol keys can be encoded; the remaining
  // kinds let foreign trees (e.g. a parsed document) carry their keys as far
  // as the encoder, which then rejects them.
  class Key {
  public:
    enum class Kind { Text, Symbol, Number, Boolean, Null };

    Key( const char* text ) : rep_( std::string(text) ) {}
    Key( std::string text ) : rep_( std::move(text) ) {}
    Key( Symbol sym ) : rep_( std::move(sym) ) {}
    Key( Number n ) : rep_( n ) {}
    Key( bool b ) : rep_( b ) {}
    Key( std::nullptr_t ) : rep_( nullptr ) {}
    Key( char c ) : rep_( std::string(1, c) ) {}

    template < typename T, std::enable_if_t<
      internal::is_numeric_v< T >, int > = 0 >
    Key( T n ) : rep_( Number(n) ) {}

    template < typename T, std::enable_if_t<
      internal::is_rejected_char_v< T >, int > = 0 >
    Key( T ) = delete;

    Kind kind() const { return static_cast< Kind >( rep_.index() ); }

    // Text of a Text or Symbol key, nothing otherwise
    std::optional< std::string > text() const;

    // Human-readable rendition of any key kind, for diagnostics
    std::string describe() const;

  private:
    std::variant< std::string, Symbol, Number, bool, std::nullptr_t > rep_;
  };

  class Value;
  struct Entry;

  // Ordered list of entries. Iteration order is output order; the encoder
  // never reorders or deduplicates.
  using Mapping = std::vector< Entry >;
  using Sequence = std::vector< Value >;

  // Closed tagged variant over every node kind the encoder understands.
  // Symbols, booleans and null make up the "other" kind.
  class Value {
  public:
    enum class Kind { Mapping, Sequence, Text, Number, Other };

    using Rep = std::variant< Mapping, Sequence, std::string, Number,
      Symbol, bool, std::nullptr_t >;

    Value();
    Value( Mapping m );
    Value( Sequence s );
    Value( const char* text );
    Value( std::string text );
    Value( Number n );
    Value( Symbol sym );
    Value( bool b );
    Value( std::nullptr_t );
    Value( char c );

    template < typename T, std::enable_if_t<
      internal::is_numeric_v< T >, int > = 0 >
    Value( T n ) : Value( Number(n) ) {}

    template < typename T, std::enable_if_t<
      internal::is_rejected_char_v< T >, int > = 0 >
    Value( T ) = delete;

    Kind kind() const;
    const char* kind_name() const;

    bool is_mapping() const { return kind() == Kind::Mapping; }
    bool is_sequence() const { return kind() == Kind::Sequence; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_number() const { return kind() == Kind::Number; }
    bool is_other() const { return kind() == Kind::Other; }

    // Checked accessors; a kind mismatch throws InvalidInputKind
    const Mapping& as_mapping() const;
    const Sequence& as_sequence() const;
    const std::string& as_text() const;
    const Number& as_number() const;

    const Rep& rep() const { return rep_; }

  private:
    Rep rep_;
  };

  struct Entry {
    Key key;
    Value value;
  };

  // Indentation settings, fixed before the first encode call
  struct IndentConfig {
    std::string unit = " ";
    int width = 2;
  };

  // Produces the leading whitespace for a nesting depth. The unit block
  // (unit repeated width times) is computed once at construction; an
  // Indenter is immutable afterwards and may be shared between threads.
  class Indenter {
  public:
    explicit Indenter( IndentConfig config = IndentConfig() );

    std::string indent( int depth ) const;
    void append_indent( std::string& out, int depth ) const;

    const IndentConfig& config() const { return config_; }
    const std::string& unit_block() const { return block_; }

  private:
    IndentConfig config_;
    std::string block_;
  };

  // Renders a mapping tree as block-style YAML text.
  //
  //   key: scalar
  //   key:
  //     nested: value
  //   key:
  //     - first: value
  //       second: value
  //     - scalar item
  //
  // Text scalars containing a space or a colon are wrapped in double quotes
  // verbatim; keys are written as given.
  class Encoder {
  public:
    explicit Encoder( Indenter indenter = Indenter() )
      : indenter_( std::move(indenter) ) {}

    std::string encode( const Value& tree ) const;
    std::string encode_at( int depth, const Value& tree ) const;

    // Appends to out instead of returning a new string. On error, out may
    // hold a partial rendition.
    void encode_into( std::string& out, int depth, const Value& tree ) const;

    const Indenter& indenter() const { return indenter_; }

    static std::string key_text( const Key& key );
    static std::string quote_if_needed( const std::string& s );
    static std::string decimal_text( const Number& n );
    static std::string best_effort_text( const Symbol& sym );
    static std::string best_effort_text( bool b );
    static std::string best_effort_text( std::nullptr_t );

  private:

    // Per-call state for one traversal: output buffer and the document
    // path used in error messages
    struct Walk {
      const Encoder* self;
      std::string& out;
      std::vector< std::string > path_stack;

      void mapping( int depth, const Mapping& m );
      void entry( int depth, const Entry& e );
      void value( int depth, const Value& v );
      void sequence( int depth, const Sequence& items );

      std::string key_of( const Key& key ) const;

      [[noreturn]] void throw_error_at( ErrorKind kind,
        const std::string& msg ) const;
    };

    // Value dispatch. Every Value::Rep alternative has an overload, so a new
    // alternative fails to compile until it is handled here.
    struct ValueRenderer {
      Walk& walk;
      int depth;

      void operator()( const Mapping& m ) const {
        walk.out += '\n';
        walk.mapping( depth + 1, m );
      }
      void operator()( const Sequence& s ) const {
        walk.out += '\n';
        walk.sequence( depth, s );
      }
      void operator()( const std::string& s ) const {
        walk.out += ' ';
        walk.out += Encoder::quote_if_needed( s );
        walk.out += '\n';
      }
      void operator()( const Number& n ) const {
        walk.out += ' ';
        walk.out += Encoder::decimal_text( n );
        walk.out += '\n';
      }
      void operator()( const Symbol& sym ) const { other( sym ); }
      void operator()( bool b ) const { other( b ); }
      void operator()( std::nullptr_t n ) const { other( n ); }

      template < typename T >
      void other( const T& v ) const {
        walk.out += ' ';
        walk.out += Encoder::best_effort_text( v );
        walk.out += '\n';
      }
    };

    Indenter indenter_;
  };

  // Process-wide default indenter (one space, width two)
  inline const Indenter& default_indenter();

  inline std::string indent( int depth );
  inline std::string encode( const Value& tree );
  inline std::string encode_at( int depth, const Value& tree );

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string DOC_ROOT = "root";

  // Connects path segments into "root.a.b[0].c"
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a path segment
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

} // namespace yeti::internal

} // namespace yeti

// Key

inline std::optional< std::string > yeti::Key::text() const {
  if ( const auto* s = std::get_if< std::string >( &rep_ ) ) return *s;
  if ( const auto* sym = std::get_if< Symbol >( &rep_ ) ) return sym->name;
  return std::nullopt;
}

inline std::string yeti::Key::describe() const {
  switch ( kind() ) {
    case Kind::Text: return '"' + std::get< std::string >( rep_ ) + '"';
    case Kind::Symbol: return ':' + std::get< Symbol >( rep_ ).name;
    case Kind::Number:
      return "number " + Encoder::decimal_text( std::get< Number >( rep_ ) );
    case Kind::Boolean:
      return std::string( "boolean " )
        + Encoder::best_effort_text( std::get< bool >( rep_ ) );
    case Kind::Null: return "null";
  }
  return "unknown";
}

// Value
//
// Defined out of line: Entry must be complete before any Mapping member is
// touched.

inline yeti::Value::Value() : rep_( nullptr ) {}
inline yeti::Value::Value( Mapping m ) : rep_( std::move(m) ) {}
inline yeti::Value::Value( Sequence s ) : rep_( std::move(s) ) {}
inline yeti::Value::Value( const char* text )
  : rep_( std::string(text) ) {}
inline yeti::Value::Value( std::string text ) : rep_( std::move(text) ) {}
inline yeti::Value::Value( Number n ) : rep_( n ) {}
inline yeti::Value::Value( Symbol sym ) : rep_( std::move(sym) ) {}
inline yeti::Value::Value( bool b ) : rep_( b ) {}
inline yeti::Value::Value( std::nullptr_t ) : rep_( nullptr ) {}
inline yeti::Value::Value( char c ) : rep_( std::string(1, c) ) {}

inline yeti::Value::Kind yeti::Value::kind() const {
  switch ( rep_.index() ) {
    case 0: return Kind::Mapping;
    case 1: return Kind::Sequence;
    case 2: return Kind::Text;
    case 3: return Kind::Number;
    default: return Kind::Other;
  }
}

inline const char* yeti::Value::kind_name() const {
  switch ( kind() ) {
    case Kind::Mapping: return "mapping";
    case Kind::Sequence: return "sequence";
    case Kind::Text: return "text";
    case Kind::Number: return "number";
    case Kind::Other: break;
  }
  if ( std::holds_alternative< Symbol >( rep_ ) ) return "symbol";
  if ( std::holds_alternative< bool >( rep_ ) ) return "boolean";
  return "null";
}

namespace yeti::internal {

  template < typename T >
  inline const T& checked_get( const Value::Rep& rep, const char* wanted,
    const char* actual )
  {
    if ( const T* p = std::get_if< T >( &rep ) ) return *p;
    std::ostringstream oss;
    oss << "expected a " << wanted << ", got a " << actual;
    throw Error( ErrorKind::InvalidInputKind, oss.str() );
  }

} // namespace yeti::internal

inline const yeti::Mapping& yeti::Value::as_mapping() const {
  return internal::checked_get< Mapping >( rep_, "mapping", kind_name() );
}

inline const yeti::Sequence& yeti::Value::as_sequence() const {
  return internal::checked_get< Sequence >( rep_, "sequence", kind_name() );
}

inline const std::string& yeti::Value::as_text() const {
  return internal::checked_get< std::string >( rep_, "text", kind_name() );
}

inline const yeti::Number& yeti::Value::as_number() const {
  return internal::checked_get< Number >( rep_, "number", kind_name() );
}

// Indenter

inline yeti::Indenter::Indenter( IndentConfig config )
  : config_( std::move(config) )
{
  if ( config_.width <= 0 ) {
    std::ostringstream oss;
    oss << "indent width must be a positive integer (got "
      << config_.width << ')';
    throw Error( ErrorKind::InvalidIndentConfig, oss.str() );
  }
  if ( config_.unit.empty() ) {
    throw Error( ErrorKind::InvalidIndentConfig,
      "indent unit must not be empty" );
  }
  block_.reserve( config_.unit.size() * config_.width );
  for ( int i = 0; i < config_.width; ++i ) block_ += config_.unit;
}

inline std::string yeti::Indenter::indent( int depth ) const {
  std::string out;
  this->append_indent( out, depth );
  return out;
}

inline void yeti::Indenter::append_indent( std::string& out,
  int depth ) const
{
  if ( depth < 0 ) {
    std::ostringstream oss;
    oss << "indentation depth must be non-negative (got " << depth << ')';
    throw Error( ErrorKind::InvalidDepth, oss.str() );
  }
  out.reserve( out.size() + block_.size() * depth );
  for ( int i = 0; i < depth; ++i ) out += block_;
}

// Encoder: scalar and key text

namespace yeti::internal {

  inline std::string unsupported_key_message( const Key& key ) {
    return "mapping key " + key.describe()
      + " is not supported (keys must be text or symbols)";
  }

} // namespace yeti::internal

inline std::string yeti::Encoder::key_text( const Key& key ) {
  std::optional< std::string > text = key.text();
  if ( !text ) {
    throw Error( ErrorKind::UnsupportedKeyType,
      internal::unsupported_key_message( key ) );
  }
  return *text;
}

// Embedded quotes and backslashes are not escaped
inline std::string yeti::Encoder::quote_if_needed( const std::string& s ) {
  if ( s.find_first_of( " :" ) == std::string::npos ) return s;
  return '"' + s + '"';
}

inline std::string yeti::Encoder::decimal_text( const Number& n ) {
  if ( n.is_unsigned() ) return std::to_string( n.as_unsigned() );
  if ( n.is_integer() ) return std::to_string( n.as_integer() );

  const double d = n.as_float();
  if ( std::isnan(d) ) return ".nan";
  if ( std::isinf(d) ) return d < 0 ? "-.inf" : ".inf";

  // Shortest round-trip form, kept recognizable as a float ("2.0", not "2")
  char buf[ 64 ];
  auto res = std::to_chars( buf, buf + sizeof(buf), d );
  std::string s( buf, res.ptr );
  if ( s.find_first_of( ".eE" ) == std::string::npos ) s += ".0";
  return s;
}

inline std::string yeti::Encoder::best_effort_text( const Symbol& sym ) {
  return sym.name;
}

inline std::string yeti::Encoder::best_effort_text( bool b ) {
  return b ? "true" : "false";
}

inline std::string yeti::Encoder::best_effort_text( std::nullptr_t ) {
  return "null";
}

// Encoder: traversal

inline std::string yeti::Encoder::encode( const Value& tree ) const {
  return this->encode_at( 0, tree );
}

inline std::string yeti::Encoder::encode_at( int depth,
  const Value& tree ) const
{
  std::string out;
  this->encode_into( out, depth, tree );
  return out;
}

inline void yeti::Encoder::encode_into( std::string& out, int depth,
  const Value& tree ) const
{
  Walk w{ this, out, { internal::DOC_ROOT } };

  if ( depth < 0 ) {
    std::ostringstream oss;
    oss << "encoding depth must be non-negative (got " << depth << ')';
    w.throw_error_at( ErrorKind::InvalidDepth, oss.str() );
  }
  if ( !tree.is_mapping() ) {
    w.throw_error_at( ErrorKind::InvalidInputKind,
      std::string( "expected a mapping, got a " ) + tree.kind_name() );
  }

  w.mapping( depth, tree.as_mapping() );
}

inline void yeti::Encoder::Walk::mapping( int depth, const Mapping& m ) {
  for ( const Entry& e : m ) this->entry( depth, e );
}

// indent + key + ":" + value
inline void yeti::Encoder::Walk::entry( int depth, const Entry& e ) {
  const std::string key = this->key_of( e.key );
  self->indenter_.append_indent( out, depth );
  out += key;
  out += ':';

  path_stack.push_back( key );
  this->value( depth, e.value );
  path_stack.pop_back();
}

inline void yeti::Encoder::Walk::value( int depth, const Value& v ) {
  std::visit( ValueRenderer{ *this, depth }, v.rep() );
}

// Mapping items put their first entry on the dash line and align the
// remaining entries one level deeper than the dash. Any other item,
// including a nested sequence, goes through the generic value path.
inline void yeti::Encoder::Walk::sequence( int depth,
  const Sequence& items )
{
  const std::string base = path_stack.back();

  for ( size_t i = 0; i < items.size(); ++i ) {
    path_stack.back() = internal::seq_indexed( base, i );
    const Value& item = items[ i ];

    if ( !item.is_mapping() ) {
      self->indenter_.append_indent( out, depth + 1 );
      out += '-';
      this->value( depth + 1, item );
      continue;
    }

    const Mapping& m = item.as_mapping();
    if ( m.empty() ) {
      this->throw_error_at( ErrorKind::EmptyMappingInSequence,
        "a mapping used as a sequence item must have at least one entry" );
    }

    const std::string first_key = this->key_of( m.front().key );
    self->indenter_.append_indent( out, depth + 1 );
    out += "- ";
    out += first_key;
    out += ':';
    path_stack.push_back( first_key );
    this->value( depth + 1, m.front().value );
    path_stack.pop_back();

    for ( auto it = m.begin() + 1; it != m.end(); ++it ) {
      this->entry( depth + 2, *it );
    }
  }

  path_stack.back() = base;
}

inline std::string yeti::Encoder::Walk::key_of( const Key& key ) const {
  std::optional< std::string > text = key.text();
  if ( !text ) {
    this->throw_error_at( ErrorKind::UnsupportedKeyType,
      internal::unsupported_key_message( key ) );
  }
  return *text;
}

// Compose "root.a.b[0].c: message"
[[noreturn]] inline void yeti::Encoder::Walk::throw_error_at(
  ErrorKind kind, const std::string& msg ) const
{
  std::ostringstream oss;
  oss << internal::join_path( path_stack ) << ": " << msg;
  throw Error( kind, oss.str() );
}

// Free functions over the default indenter

inline const yeti::Indenter& yeti::default_indenter() {
  static const Indenter indenter;
  return indenter;
}

inline std::string yeti::indent( int depth ) {
  return default_indenter().indent( depth );
}

inline std::string yeti::encode( const Value& tree ) {
  return Encoder( default_indenter() ).encode( tree );
}

inline std::string yeti::encode_at( int depth, const Value& tree ) {
  return Encoder( default_indenter() ).encode_at( depth, tree );
}
