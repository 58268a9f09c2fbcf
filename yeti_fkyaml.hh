// ╻ ╻┏━╸╺┳╸╻
// ┗┳┛┣╸  ┃ ┃
//  ╹ ┗━╸ ╹ ╹
//  YAML Emitter for Tree Inputs
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <istream>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "yeti.hh"

namespace yeti {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Convert a parsed document node into an encoder tree. Mapping entries
  // keep document order. Scalar keys that the encoder cannot render
  // (numbers, booleans, null) are carried over and rejected at encode time;
  // collection keys are rejected here with UnsupportedNode.
  inline Value from_node( const ordered_node& node );

  // Parse a single YAML document and convert it
  inline Value from_yaml( const std::string& text );
  inline Value from_yaml( std::istream& in );

namespace internal {

  // Short rendition of a key node for error paths
  inline std::string key_path_segment( const ordered_node& k ) {
    if ( k.is_string() ) return k.get_value< std::string >();
    if ( k.is_integer() ) return std::to_string( k.get_value< std::int64_t >() );
    if ( k.is_boolean() ) return k.get_value< bool >() ? "true" : "false";
    if ( k.is_float_number() ) {
      return Encoder::decimal_text( Number(k.get_value< double >()) );
    }
    if ( k.is_null() ) return "null";
    return k.is_mapping() ? "{...}" : "[...]";
  }

  [[noreturn]] inline void throw_node_error_at(
    const std::vector< std::string >& path, const std::string& msg )
  {
    std::ostringstream oss;
    oss << join_path( path ) << ": " << msg;
    throw Error( ErrorKind::UnsupportedNode, oss.str() );
  }

  inline Key key_from_node( const ordered_node& k,
    const std::vector< std::string >& path )
  {
    if ( k.is_string() ) return Key( k.get_value< std::string >() );
    if ( k.is_integer() ) return Key( k.get_value< std::int64_t >() );
    if ( k.is_float_number() ) return Key( k.get_value< double >() );
    if ( k.is_boolean() ) return Key( k.get_value< bool >() );
    if ( k.is_null() ) return Key( nullptr );

    throw_node_error_at( path,
      "a collection used as a mapping key cannot be represented" );
  }

  inline Value value_from_node( const ordered_node& n,
    std::vector< std::string >& path )
  {
    if ( n.is_mapping() ) {
      Mapping m;
      m.reserve( n.size() );
      for ( const auto& [mk, mv] : n.map_items() ) {
        Key key = key_from_node( mk, path );
        path.push_back( key_path_segment(mk) );
        m.push_back( Entry{ std::move(key), value_from_node(mv, path) } );
        path.pop_back();
      }
      return Value( std::move(m) );
    }

    if ( n.is_sequence() ) {
      Sequence s;
      s.reserve( n.size() );
      const std::string base = path.back();
      for ( size_t i = 0; i < n.size(); ++i ) {
        path.back() = seq_indexed( base, i );
        s.push_back( value_from_node(n.at(i), path) );
      }
      path.back() = base;
      return Value( std::move(s) );
    }

    if ( n.is_string() ) return Value( n.get_value< std::string >() );
    if ( n.is_integer() ) return Value( n.get_value< std::int64_t >() );
    if ( n.is_float_number() ) return Value( n.get_value< double >() );
    if ( n.is_boolean() ) return Value( n.get_value< bool >() );
    if ( n.is_null() ) return Value( nullptr );

    throw_node_error_at( path, "node type cannot be represented" );
  }

} // namespace yeti::internal

} // namespace yeti

inline yeti::Value yeti::from_node( const ordered_node& node ) {
  std::vector< std::string > path = { internal::DOC_ROOT };
  return internal::value_from_node( node, path );
}

inline yeti::Value yeti::from_yaml( const std::string& text ) {
  return from_node( ordered_node::deserialize( text ) );
}

// Read from an input stream until end-of-file, then parse the resulting
// string
inline yeti::Value yeti::from_yaml( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_yaml( ss.str() );
}
