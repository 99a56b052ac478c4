// Core records exchanged between the planner, the reconciler and the
// state store
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "converge/node.hh"

namespace converge {

  // Opaque identifier of a live instance, produced by the stepper
  using InstanceHandle = std::string;

  // Digest string produced by fingerprint(...)
  using Fingerprint = std::string;

  // One declared integration
  struct DesiredItem {
    std::string platform;
    std::string configuration_id;
    Steps answers;
    Steps options;
    bool recreate_on_options_change = false;
  };

  // Last-applied state of one configuration id
  struct StoredRecord {
    std::string platform;
    Fingerprint answers_fingerprint;
    Fingerprint options_fingerprint;
    InstanceHandle instance_handle;
  };

  inline bool operator==( const StoredRecord& a, const StoredRecord& b ) {
    return a.platform == b.platform
      && a.answers_fingerprint == b.answers_fingerprint
      && a.options_fingerprint == b.options_fingerprint
      && a.instance_handle == b.instance_handle;
  }

  inline bool operator!=( const StoredRecord& a, const StoredRecord& b ) {
    return !( a == b );
  }

  // Stored records keyed by configuration id
  using StoredState = std::map< std::string, StoredRecord >;

  enum class OperationKind { Delete, Create, Recreate, UpdateOptions, NoOp };

  inline const char* to_string( OperationKind kind ) {
    switch ( kind ) {
      case OperationKind::Delete: return "delete";
      case OperationKind::Create: return "create";
      case OperationKind::Recreate: return "recreate";
      case OperationKind::UpdateOptions: return "update_options";
      case OperationKind::NoOp: return "noop";
    }
    return "unknown";
  }

  // One step of a reconciliation plan. `item` is set for Create and
  // Recreate, `options` for UpdateOptions. The fingerprints of the desired
  // answers/options are computed once, at planning time.
  struct Operation {
    OperationKind kind = OperationKind::NoOp;
    std::string configuration_id;
    std::optional< DesiredItem > item;
    Steps options;
    Fingerprint answers_fingerprint;
    Fingerprint options_fingerprint;
  };

  using ReconciliationPlan = std::vector< Operation >;

  enum class Outcome { Success, Skipped, Error };

  inline const char* to_string( Outcome outcome ) {
    switch ( outcome ) {
      case Outcome::Success: return "success";
      case Outcome::Skipped: return "skipped";
      case Outcome::Error: return "error";
    }
    return "unknown";
  }

  // Classification of a reported item error
  enum class ErrorKind { None, Validation, NotFound, Transient, Conflict,
    Internal };

  inline const char* to_string( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::None: return "none";
      case ErrorKind::Validation: return "validation";
      case ErrorKind::NotFound: return "not_found";
      case ErrorKind::Transient: return "transient";
      case ErrorKind::Conflict: return "conflict";
      case ErrorKind::Internal: return "internal";
    }
    return "unknown";
  }

  struct ReportEntry {
    std::string configuration_id;
    OperationKind operation = OperationKind::NoOp;
    Outcome outcome = Outcome::Success;
    ErrorKind error = ErrorKind::None;
    std::string detail;
  };

  // Result of one reconciliation pass
  struct ReconciliationReport {
    std::vector< ReportEntry > entries;
    bool cancelled = false;

    inline std::size_t count( Outcome outcome ) const {
      std::size_t n = 0;
      for ( const auto& e : entries ) {
        if ( e.outcome == outcome ) ++n;
      }
      return n;
    }

    inline bool has_errors() const { return count( Outcome::Error ) > 0; }

    // First entry for the given id and operation, if any
    inline const ReportEntry* find( const std::string& configuration_id,
      OperationKind operation ) const
    {
      for ( const auto& e : entries ) {
        if ( e.configuration_id == configuration_id
          && e.operation == operation ) return &e;
      }
      return nullptr;
    }
  };

} // namespace converge
