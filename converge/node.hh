// YAML value type used for answers, options, documents and the lock file,
// together with the small conversion helpers built on it
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include <fkYAML/node.hpp>

#include "converge/error.hh"

namespace converge {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the authored key order, so documents and
  // reports are written back the way they were read.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // An ordered list of mappings, one per protocol step. Used for both the
  // setup answers and the post-setup options of an integration.
  using Steps = std::vector< ordered_node >;

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string DOC_ROOT = "root";

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( std::size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, std::size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // Not a scalar, so fall back to serialization
    return ordered_node::serialize( n );
  }

  inline ordered_node steps_to_node( const Steps& steps ) {
    return make_node_from( steps );
  }

  inline bool is_blank( const std::string& text ) {
    for ( char c : text ) {
      if ( !std::isspace(static_cast< unsigned char >(c)) ) return false;
    }
    return true;
  }

  // Mapping key as a string, whatever its scalar type
  inline std::string key_string( const ordered_node& key ) {
    return to_string_any( key );
  }

  // Helpers for rejection of YAML anchors/aliases in raw text input. A
  // desired-state document is compared against its own history, so every
  // value has to be spelled out where it is used.

  inline bool is_anchor_alias_name_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_' || c == '-';
  }

  // Characters that can precede the start of a YAML value token
  inline bool is_boundary_left_char( char ch ) {
    switch ( ch ) {
      case ' ': case '\t': case '-': case ':':
      case '[': case '{': case ',':
        return true;
      default: return false;
    }
  }

  // Characters that can follow the end of an alias/anchor token
  inline bool is_boundary_right_char( char ch ) {
    switch ( ch ) {
      case ' ': case '\t': case '\r': case '\n':
      case ',': case ']': case '}': case '#': case ':':
        return true;
      default: return false;
    }
  }

  // Reject anchor/alias tokens (&/*) at value boundaries in raw YAML text.
  // Comments and quoted strings are skipped.
  inline void reject_anchors_aliases( const std::string& text ) {
    bool in_single = false, in_double = false, in_comment = false;
    std::size_t line = 1, col = 0;

    for ( std::size_t i = 0; i < text.size(); ++i ) {
      char c = text[ i ]; col++;

      if ( c == '\n' ) { in_comment = false; line++; col = 0; continue; }

      if ( !in_double && !in_single ) {
        if ( !in_comment && c == '#' ) { in_comment = true; continue; }
      }
      if ( in_comment ) continue;

      if ( in_single ) {
        if ( c == '\'' ) in_single = false;
        continue;
      }
      if ( in_double ) {
        if ( c == '\\' && i + 1 < text.size() && text[i + 1] != '\n' ) {
          ++i; ++col;
        }
        else if ( c == '\"' ) in_double = false;
        continue;
      }

      if ( c != '\'' && c != '\"' && c != '&' && c != '*' ) continue;

      // Quotes and markers only count where a value can start; an
      // apostrophe inside a plain scalar is text
      std::size_t p = i;
      while ( p > 0 && (text[p - 1] == ' ' || text[p - 1] == '\t') ) --p;
      bool at_value_start = ( p == 0 ) || ( text[p - 1] == '\n' )
        || is_boundary_left_char( text[p - 1] );
      if ( !at_value_start ) continue;

      if ( c == '\'' ) { in_single = true; continue; }
      if ( c == '\"' ) { in_double = true; continue; }

      std::size_t j = i + 1;
      if ( j >= text.size() || !is_anchor_alias_name_char(text[j]) ) continue;

      std::size_t k = j + 1;
      while ( k < text.size() && is_anchor_alias_name_char(text[k]) ) ++k;

      std::size_t r = k;
      while ( r < text.size()
        && (text[r] == ' ' || text[r] == '\t' || text[r] == '\r') ) ++r;
      bool ends_here = ( r >= text.size() ) || ( text[r] == '\n' )
        || is_boundary_right_char( text[r] );
      if ( !ends_here ) continue;

      std::ostringstream oss;
      oss << "YAML " << ( c == '&' ? "anchors" : "aliases" )
        << " are not supported in desired-state documents (found '" << c
        << text.substr( j, k - j ) << "' at line " << line << ", column "
        << col << ")";
      throw DocumentError( oss.str() );
    }
  }

} // namespace internal

} // namespace converge
