// Desired-state document loader.
//
//   integrations:
//     - platform: broadlink
//       configuration_id: office
//       answers:
//         - host: 192.168.3.146
//         - name: Office Broadlink
//       options:
//         - learning_timeout: 30
//       recreate_on_options_change: false
//
// Other top-level keys are ignored so the list can live inside a larger
// host configuration file.
#pragma once

// Standard library includes
#include <istream>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "converge/error.hh"
#include "converge/node.hh"
#include "converge/types.hh"

namespace converge {

namespace internal {

  inline const std::string DOC_INTEGRATIONS = "integrations";
  inline const std::string DOC_PLATFORM = "platform";
  inline const std::string DOC_CONFIG_ID = "configuration_id";
  inline const std::string DOC_ANSWERS = "answers";
  inline const std::string DOC_OPTIONS = "options";
  inline const std::string DOC_RECREATE_OPTIONS = "recreate_on_options_change";

} // namespace internal

  class DocumentLoader {
  public:
    std::vector< DesiredItem > load( std::istream& in );
    std::vector< DesiredItem > load( const std::string& text );
    std::vector< DesiredItem > load_file( const std::string& path );

  private:
    // Tracks the path using sequence-element indexing,
    // e.g., ["root", "integrations[0]", "answers"]
    std::vector< std::string > path_stack_;

    DesiredItem parse_item( const ordered_node& entry );
    std::string required_string( const ordered_node& entry,
      const std::string& key );
    Steps parse_steps( const ordered_node& entry, const std::string& key,
      bool required );

    // Helper for building error messages
    [[noreturn]] void throw_error_at( const std::string& msg,
      const std::optional< std::string >& hint = std::nullopt );
  };

} // namespace converge

// DocumentLoader member function definitions

// Read from an input stream until end-of-file, then parse the resulting
// string
inline std::vector< converge::DesiredItem > converge::DocumentLoader::load(
  std::istream& in )
{
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->load( ss.str() );
}

inline std::vector< converge::DesiredItem >
  converge::DocumentLoader::load_file( const std::string& path )
{
  std::ifstream in( path );
  if ( !in ) {
    throw DocumentError( "cannot open desired-state document '" + path
      + "'" );
  }
  return this->load( in );
}

inline std::vector< converge::DesiredItem > converge::DocumentLoader::load(
  const std::string& text )
{
  using internal::DOC_CONFIG_ID;
  using internal::DOC_INTEGRATIONS;

  path_stack_.clear();
  path_stack_.push_back( internal::DOC_ROOT );

  std::vector< DesiredItem > items;
  if ( internal::is_blank(text) ) return items;

  internal::reject_anchors_aliases( text );

  ordered_node doc;
  try {
    doc = ordered_node::deserialize( text );
  } catch ( const fkyaml::exception& ex ) {
    throw DocumentError( std::string("malformed YAML: ") + ex.what() );
  }

  if ( doc.is_null() ) return items;
  if ( !doc.is_mapping() ) throw_error_at( "document must be a mapping" );
  if ( !doc.contains(DOC_INTEGRATIONS) || doc.at(DOC_INTEGRATIONS).is_null() )
  {
    return items;
  }

  const ordered_node& list = doc.at( DOC_INTEGRATIONS );
  path_stack_.push_back( DOC_INTEGRATIONS );
  if ( !list.is_sequence() ) throw_error_at( "must be a sequence" );

  // configuration id -> index of first declaration
  std::unordered_map< std::string, std::size_t > first_seen;
  items.reserve( list.size() );

  for ( std::size_t i = 0; i < list.size(); ++i ) {
    path_stack_.back() = internal::seq_indexed( DOC_INTEGRATIONS, i );
    DesiredItem item = this->parse_item( list.at(i) );

    auto [it, inserted] = first_seen.emplace( item.configuration_id, i );
    if ( !inserted ) {
      path_stack_.push_back( DOC_CONFIG_ID );
      throw_error_at( "duplicate configuration id '" + item.configuration_id
        + "'", "first declared at " + internal::seq_indexed(
          DOC_INTEGRATIONS, it->second) );
    }
    items.push_back( std::move(item) );
  }
  return items;
}

inline converge::DesiredItem converge::DocumentLoader::parse_item(
  const ordered_node& entry )
{
  using namespace internal;

  if ( !entry.is_mapping() ) throw_error_at( "integration must be a mapping" );

  static const std::unordered_set< std::string > known = {
    DOC_PLATFORM, DOC_CONFIG_ID, DOC_ANSWERS, DOC_OPTIONS,
    DOC_RECREATE_OPTIONS
  };
  for ( const auto& [mk, mv] : entry.map_items() ) {
    const std::string k = key_string( mk );
    if ( !known.count(k) ) {
      throw_error_at( "unknown key '" + k + "'",
        "expected platform, configuration_id, answers, options or "
        "recreate_on_options_change" );
    }
  }

  DesiredItem item;
  item.platform = this->required_string( entry, DOC_PLATFORM );
  item.configuration_id = this->required_string( entry, DOC_CONFIG_ID );
  item.answers = this->parse_steps( entry, DOC_ANSWERS, true );
  item.options = this->parse_steps( entry, DOC_OPTIONS, false );

  if ( entry.contains(DOC_RECREATE_OPTIONS)
    && !entry.at(DOC_RECREATE_OPTIONS).is_null() )
  {
    const ordered_node& flag = entry.at( DOC_RECREATE_OPTIONS );
    if ( !flag.is_boolean() ) {
      path_stack_.push_back( DOC_RECREATE_OPTIONS );
      throw_error_at( "must be a boolean" );
    }
    item.recreate_on_options_change = flag.get_value< bool >();
  }
  return item;
}

inline std::string converge::DocumentLoader::required_string(
  const ordered_node& entry, const std::string& key )
{
  if ( !entry.contains(key) ) throw_error_at( "missing required '" + key
    + "'" );
  const ordered_node& v = entry.at( key );
  path_stack_.push_back( key );
  if ( !v.is_string() ) throw_error_at( "must be a string" );
  std::string s = internal::to_native_checked< std::string >( v );
  if ( s.empty() ) throw_error_at( "must not be empty" );
  path_stack_.pop_back();
  return s;
}

// Answers and options are sequences of mappings, one mapping per step.
// Values inside a step are kept as authored.
inline converge::Steps converge::DocumentLoader::parse_steps(
  const ordered_node& entry, const std::string& key, bool required )
{
  Steps steps;
  if ( !entry.contains(key) || entry.at(key).is_null() ) {
    if ( required ) throw_error_at( "missing required '" + key + "'" );
    return steps;
  }

  const ordered_node& seq = entry.at( key );
  path_stack_.push_back( key );
  if ( !seq.is_sequence() ) {
    throw_error_at( "must be a sequence of mappings, one per step" );
  }

  steps.reserve( seq.size() );
  for ( std::size_t i = 0; i < seq.size(); ++i ) {
    const ordered_node& step = seq.at( i );
    if ( !step.is_mapping() ) {
      path_stack_.back() = internal::seq_indexed( key, i );
      throw_error_at( "step must be a mapping" );
    }
    steps.push_back( step );
  }
  path_stack_.pop_back();
  return steps;
}

[[noreturn]] inline void converge::DocumentLoader::throw_error_at(
  const std::string& msg,
  const std::optional< std::string >& hint )
{
  // Compose "root.integrations[0].answers: message (hint)"
  std::ostringstream oss;
  oss << internal::join_path( path_stack_ ) << ": " << msg;
  if ( hint && !hint->empty() ) {
    oss << " (" << *hint << ')';
  }
  throw DocumentError( oss.str() );
}
