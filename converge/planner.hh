// Diff engine: compares desired items against stored records and produces
// the ordered list of operations that converges the two.
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "converge/fingerprint.hh"
#include "converge/types.hh"

namespace converge {

namespace internal {

  // Decision for one id present on both sides
  inline OperationKind classify( const DesiredItem& d, const StoredRecord& s,
    const Fingerprint& answers_fp, const Fingerprint& options_fp )
  {
    // A stored record without a live handle cannot be replaced in place
    if ( s.instance_handle.empty() ) return OperationKind::Create;

    // A platform change cannot be reinterpreted by the same connector, so
    // it counts as an answers change
    if ( d.platform != s.platform ) return OperationKind::Recreate;
    if ( answers_fp != s.answers_fingerprint ) return OperationKind::Recreate;

    if ( options_fp != s.options_fingerprint ) {
      return d.recreate_on_options_change
        ? OperationKind::Recreate : OperationKind::UpdateOptions;
    }
    return OperationKind::NoOp;
  }

} // namespace internal

  // Plan order: Delete operations for stored ids that are no longer
  // desired (in store order), then one operation per desired item in
  // document order. Later duplicates of a configuration id are ignored.
  // Execution order (deletes before creates) is the reconciler's concern.
  inline ReconciliationPlan plan( const std::vector< DesiredItem >& desired,
    const StoredState& stored )
  {
    ReconciliationPlan out;

    std::unordered_set< std::string > desired_ids;
    for ( const auto& d : desired ) desired_ids.insert( d.configuration_id );

    for ( const auto& [id, record] : stored ) {
      if ( desired_ids.count(id) ) continue;
      Operation op;
      op.kind = OperationKind::Delete;
      op.configuration_id = id;
      out.push_back( std::move(op) );
    }

    std::unordered_set< std::string > seen;
    for ( const auto& d : desired ) {
      if ( !seen.insert(d.configuration_id).second ) continue;

      Operation op;
      op.configuration_id = d.configuration_id;
      op.answers_fingerprint = fingerprint( d.answers );
      op.options_fingerprint = fingerprint( d.options );

      auto it = stored.find( d.configuration_id );
      if ( it == stored.end() ) {
        op.kind = OperationKind::Create;
      }
      else {
        op.kind = internal::classify( d, it->second, op.answers_fingerprint,
          op.options_fingerprint );
      }

      if ( op.kind == OperationKind::Create
        || op.kind == OperationKind::Recreate ) op.item = d;
      if ( op.kind == OperationKind::UpdateOptions ) op.options = d.options;

      out.push_back( std::move(op) );
    }
    return out;
  }

} // namespace converge
