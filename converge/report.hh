// YAML renderings of plans and reports
#pragma once

#include <string>
#include <vector>

#include "converge/node.hh"
#include "converge/types.hh"

namespace converge {

  // - configuration_id: office
  //   operation: create
  //   platform: broadlink
  inline ordered_node plan_to_node( const ReconciliationPlan& plan ) {
    using internal::make_node_from;

    std::vector< ordered_node > ops;
    ops.reserve( plan.size() );
    for ( const auto& op : plan ) {
      ordered_node n = ordered_node::mapping();
      n[ std::string("configuration_id") ] = make_node_from(
        op.configuration_id );
      n[ std::string("operation") ] = make_node_from(
        std::string(to_string(op.kind)) );
      if ( op.item ) {
        n[ std::string("platform") ] = make_node_from( op.item->platform );
      }
      ops.push_back( std::move(n) );
    }
    return make_node_from( ops );
  }

  // cancelled: false
  // summary: {success: 1, skipped: 0, error: 0}
  // entries:
  //   - configuration_id: office
  //     operation: create
  //     outcome: success
  //     detail: instance 8c1e...
  inline ordered_node report_to_node( const ReconciliationReport& report ) {
    using internal::make_node_from;

    ordered_node summary = ordered_node::mapping();
    for ( Outcome o : { Outcome::Success, Outcome::Skipped, Outcome::Error } ) {
      summary[ std::string(to_string(o)) ] = make_node_from(
        static_cast< std::int64_t >( report.count(o) ) );
    }

    std::vector< ordered_node > entries;
    entries.reserve( report.entries.size() );
    for ( const auto& e : report.entries ) {
      ordered_node n = ordered_node::mapping();
      n[ std::string("configuration_id") ] = make_node_from(
        e.configuration_id );
      n[ std::string("operation") ] = make_node_from(
        std::string(to_string(e.operation)) );
      n[ std::string("outcome") ] = make_node_from(
        std::string(to_string(e.outcome)) );
      if ( e.error != ErrorKind::None ) {
        n[ std::string("error") ] = make_node_from(
          std::string(to_string(e.error)) );
      }
      if ( !e.detail.empty() ) {
        n[ std::string("detail") ] = make_node_from( e.detail );
      }
      entries.push_back( std::move(n) );
    }

    ordered_node root = ordered_node::mapping();
    root[ std::string("cancelled") ] = make_node_from( report.cancelled );
    root[ std::string("summary") ] = summary;
    root[ std::string("entries") ] = make_node_from( entries );
    return root;
  }

} // namespace converge
