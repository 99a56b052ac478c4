// Deterministic fingerprints of answers/options structures.
//
// The canonical encoding is a tagged, length-prefixed rendering of a node
// tree:
//   null      n
//   boolean   b0 | b1
//   integer   i<decimal>;
//   float     f<hexfloat>;
//   string    s<byte length>:<bytes>
//   sequence  [<count>:<elements in order>]
//   mapping   {<count>:<key><value>...} with entries sorted by encoded key
// Sequence order is kept (step order is meaningful), mapping order is not.
// The fingerprint is "sha256:" followed by the lowercase hex SHA-256 of the
// encoding, so it is stable across processes and implementations.
#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#include "converge/node.hh"
#include "converge/types.hh"

namespace converge {

namespace internal {

  inline constexpr const char* FINGERPRINT_PREFIX = "sha256:";

  inline void canonical_encode( const ordered_node& n, std::string& out );

  inline void canonical_encode_string( const std::string& s,
    std::string& out )
  {
    out += 's';
    out += std::to_string( s.size() );
    out += ':';
    out += s;
  }

  inline void canonical_encode( const ordered_node& n, std::string& out ) {
    if ( n.is_null() ) {
      out += 'n';
    }
    else if ( n.is_boolean() ) {
      out += n.get_value< bool >() ? "b1" : "b0";
    }
    else if ( n.is_integer() ) {
      out += 'i';
      out += std::to_string( to_native_checked< std::int64_t >(n) );
      out += ';';
    }
    else if ( n.is_float_number() ) {
      // hexfloat is exact, so equal doubles always encode identically
      std::ostringstream oss;
      oss << std::hexfloat << to_native_checked< double >( n );
      out += 'f';
      out += oss.str();
      out += ';';
    }
    else if ( n.is_string() ) {
      canonical_encode_string( to_native_checked< std::string >(n), out );
    }
    else if ( n.is_sequence() ) {
      out += '[';
      out += std::to_string( n.size() );
      out += ':';
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        canonical_encode( n.at(i), out );
      }
      out += ']';
    }
    else if ( n.is_mapping() ) {
      std::vector< std::pair< std::string, std::string > > entries;
      entries.reserve( n.size() );
      for ( const auto& [mk, mv] : n.map_items() ) {
        std::pair< std::string, std::string > e;
        canonical_encode( mk, e.first );
        canonical_encode( mv, e.second );
        entries.push_back( std::move(e) );
      }
      std::sort( entries.begin(), entries.end() );

      out += '{';
      out += std::to_string( entries.size() );
      out += ':';
      for ( const auto& e : entries ) {
        out += e.first;
        out += e.second;
      }
      out += '}';
    }
  }

  struct EvpCtxDeleter {
    void operator()( EVP_MD_CTX* ctx ) const { EVP_MD_CTX_free( ctx ); }
  };

  inline std::string sha256_hex( const std::string& data ) {
    std::unique_ptr< EVP_MD_CTX, EvpCtxDeleter > ctx( EVP_MD_CTX_new() );
    unsigned char digest[ EVP_MAX_MD_SIZE ];
    unsigned int length = 0;
    if ( !ctx
      || EVP_DigestInit_ex( ctx.get(), EVP_sha256(), nullptr ) != 1
      || EVP_DigestUpdate( ctx.get(), data.data(), data.size() ) != 1
      || EVP_DigestFinal_ex( ctx.get(), digest, &length ) != 1 )
    {
      throw Error( "SHA-256 digest computation failed" );
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill( '0' );
    for ( unsigned int i = 0; i < length; ++i ) {
      oss << std::setw( 2 ) << static_cast< unsigned int >( digest[i] );
    }
    return oss.str();
  }

} // namespace internal

  // Canonical encoding of an ordered list of step mappings
  inline std::string canonical_encoding( const Steps& steps ) {
    std::string out;
    out += '[';
    out += std::to_string( steps.size() );
    out += ':';
    for ( const auto& step : steps ) internal::canonical_encode( step, out );
    out += ']';
    return out;
  }

  inline Fingerprint fingerprint( const Steps& steps ) {
    return internal::FINGERPRINT_PREFIX
      + internal::sha256_hex( canonical_encoding(steps) );
  }

} // namespace converge
