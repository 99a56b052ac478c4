// Drives one convergence pass: load stored state, plan, execute the plan
// through the stepper and record every successful step immediately
#pragma once

// Standard library includes
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "converge/error.hh"
#include "converge/fingerprint.hh"
#include "converge/keyed_mutex.hh"
#include "converge/planner.hh"
#include "converge/state_store.hh"
#include "converge/stepper.hh"
#include "converge/types.hh"

namespace converge {

  struct ReconcilerOptions {
    // Upper bound on concurrently executing operations (distinct ids only)
    std::size_t max_concurrency = 1;

    // Check stored instances with Stepper::instance_exists before planning
    bool detect_drift = true;

    // When false, ids whose lock is held by another pass are skipped
    // instead of waited for
    bool wait_for_in_flight = true;

    // Checked between operations. Operations not yet started when it turns
    // true are reported as skipped.
    const std::atomic< bool >* cancel = nullptr;
  };

  class Reconciler {
  public:
    // `locks` may be shared with other reconcilers working on the same
    // configuration ids
    inline Reconciler( StateStore& store, Stepper& stepper,
      ReconcilerOptions options = ReconcilerOptions(),
      std::shared_ptr< KeyedMutex > locks = nullptr )
      : store_( store ), stepper_( stepper ), options_( options ),
        locks_( locks ? std::move(locks) : std::make_shared< KeyedMutex >() )
    {}

    // One full pass. Item failures end up in the report; only StoreError
    // (or a failure to start worker threads) propagates.
    ReconciliationReport run( const std::vector< DesiredItem >& desired );

    // Plan executed by the most recent run()
    inline const ReconciliationPlan& last_plan() const { return last_plan_; }

  private:

    // The two execution phases: every teardown (Delete, and the delete half
    // of Recreate) finishes before any build step starts
    enum class Phase { Teardown, Build };

    struct Task {
      std::size_t index; // into PassSession::plan
      Phase phase;
    };

    struct OperationResult {
      ReportEntry entry;
      std::optional< ReportEntry > options_entry;
      bool teardown_done = false;
    };

    // Wraps internal state refreshed upon each call to run(...)
    struct PassSession {
      // Snapshot the plan was computed from, read-only during execution
      StoredState snapshot;
      ReconciliationPlan plan;
      std::vector< OperationResult > results;
      std::vector< ReportEntry > drift_entries;
      Fingerprint empty_options_fingerprint;
      std::atomic< bool > cancelled{ false };
    };

    StateStore& store_;
    Stepper& stepper_;
    ReconcilerOptions options_;
    std::shared_ptr< KeyedMutex > locks_;
    std::unique_ptr< PassSession > session_;
    ReconciliationPlan last_plan_;

    // Processing stages
    void prune_drift( const std::vector< DesiredItem >& desired );
    std::vector< Task > tasks_for( Phase phase ) const;
    void run_phase( const std::vector< Task >& tasks );
    ReconciliationReport assemble_report() const;

    void execute( const Task& task );
    bool cancel_requested() const;
    KeyedMutex::Guard acquire( const std::string& configuration_id );
    bool state_unchanged( const Operation& op, Phase phase );

    bool remove_instance( const std::string& configuration_id,
      ReportEntry& entry );
    bool create_instance( const Operation& op, OperationResult& result );
    void apply_initial_options( const Operation& op, StoredRecord record,
      OperationResult& result );
    void update_options( const Operation& op, OperationResult& result );

    // Runs one stepper interaction. Item-level failures are written into
    // `entry` and yield false; StoreError propagates.
    template < typename Fn >
    bool attempt( ReportEntry& entry, Fn&& fn );

  }; // class Reconciler

namespace internal {

  inline void mark_error( ReportEntry& entry, ErrorKind kind,
    const std::string& detail )
  {
    entry.outcome = Outcome::Error;
    entry.error = kind;
    entry.detail = detail;
  }

  inline void mark_skipped( ReportEntry& entry, const std::string& detail ) {
    entry.outcome = Outcome::Skipped;
    entry.error = ErrorKind::None;
    entry.detail = detail;
  }

} // namespace internal

} // namespace converge

// Reconciler member function definitions

inline converge::ReconciliationReport converge::Reconciler::run(
  const std::vector< DesiredItem >& desired )
{
  // Rebuild default session state for this call
  session_ = std::make_unique< PassSession >();
  session_->empty_options_fingerprint = fingerprint( Steps() );

  // 1) Snapshot of the last-applied state. A failure here aborts the pass.
  session_->snapshot = store_.load();

  // 2) Forget records whose instance vanished out-of-band
  if ( options_.detect_drift ) this->prune_drift( desired );

  // 3) Plan against the snapshot; never recomputed during execution
  session_->plan = plan( desired, session_->snapshot );
  last_plan_ = session_->plan;

  session_->results.resize( session_->plan.size() );
  for ( std::size_t i = 0; i < session_->plan.size(); ++i ) {
    const Operation& op = session_->plan[ i ];
    ReportEntry& entry = session_->results[ i ].entry;
    entry.configuration_id = op.configuration_id;
    entry.operation = op.kind;
  }

  std::size_t noops = 0;
  for ( const auto& op : session_->plan ) {
    if ( op.kind == OperationKind::NoOp ) ++noops;
  }
  spdlog::info( "Reconciling {} desired integration(s) against {} stored "
    "record(s): {} operation(s), {} unchanged", desired.size(),
    session_->snapshot.size(), session_->plan.size() - noops, noops );

  // 4) Teardown, then build
  this->run_phase( this->tasks_for(Phase::Teardown) );
  this->run_phase( this->tasks_for(Phase::Build) );

  ReconciliationReport report = this->assemble_report();
  spdlog::info( "Reconciliation finished: {} succeeded, {} skipped, "
    "{} failed{}", report.count(Outcome::Success),
    report.count(Outcome::Skipped), report.count(Outcome::Error),
    report.cancelled ? " (cancelled)" : "" );
  return report;
}

inline void converge::Reconciler::prune_drift(
  const std::vector< DesiredItem >& desired )
{
  std::unordered_set< std::string > desired_ids;
  for ( const auto& d : desired ) desired_ids.insert( d.configuration_id );

  std::vector< std::string > gone;
  for ( const auto& [id, record] : session_->snapshot ) {
    if ( record.instance_handle.empty() ) continue;
    KeyedMutex::Guard guard = this->acquire( id );
    if ( !guard ) continue;

    // Written by a concurrent pass since the snapshot; the operation check
    // in execute() reports it
    std::optional< StoredRecord > current = store_.get( id );
    if ( !current || *current != record ) continue;

    bool exists = true;
    try {
      exists = stepper_.instance_exists( record.instance_handle );
    } catch ( const std::exception& ex ) {
      spdlog::warn( "Cannot check instance {} of {}: {}",
        record.instance_handle, id, ex.what() );
      continue;
    }
    if ( exists ) continue;

    spdlog::warn( "Instance {} of {} was removed out-of-band",
      record.instance_handle, id );
    store_.remove( id );
    gone.push_back( id );
  }

  for ( const auto& id : gone ) {
    session_->snapshot.erase( id );
    if ( desired_ids.count(id) ) continue;
    ReportEntry entry;
    entry.configuration_id = id;
    entry.operation = OperationKind::Delete;
    entry.outcome = Outcome::Success;
    entry.detail = "instance already absent";
    session_->drift_entries.push_back( std::move(entry) );
  }
}

inline std::vector< converge::Reconciler::Task >
  converge::Reconciler::tasks_for( Phase phase ) const
{
  std::vector< Task > tasks;
  for ( std::size_t i = 0; i < session_->plan.size(); ++i ) {
    const OperationKind kind = session_->plan[ i ].kind;
    if ( phase == Phase::Teardown ) {
      if ( kind == OperationKind::Delete || kind == OperationKind::Recreate ) {
        tasks.push_back( Task{ i, phase } );
      }
      continue;
    }
    switch ( kind ) {
      case OperationKind::Create:
      case OperationKind::UpdateOptions:
        tasks.push_back( Task{ i, phase } );
        break;
      case OperationKind::Recreate:
        // Only the recreates whose old instance is gone
        if ( session_->results[ i ].teardown_done ) {
          tasks.push_back( Task{ i, phase } );
        }
        break;
      case OperationKind::Delete:
      case OperationKind::NoOp:
        break;
    }
  }
  return tasks;
}

inline void converge::Reconciler::run_phase( const std::vector< Task >& tasks )
{
  if ( tasks.empty() ) return;

  std::atomic< std::size_t > next{ 0 };
  std::atomic< bool > stop{ false };
  std::mutex fatal_mutex;
  std::exception_ptr fatal;

  auto worker = [&]() {
    while ( !stop.load() ) {
      const std::size_t i = next.fetch_add( 1 );
      if ( i >= tasks.size() ) return;
      try {
        this->execute( tasks[i] );
      } catch ( ... ) {
        // Fatal for the pass: remembered and rethrown once every worker
        // has stopped
        std::lock_guard< std::mutex > lock( fatal_mutex );
        if ( !fatal ) fatal = std::current_exception();
        stop = true;
      }
    }
  };

  const std::size_t workers = std::min( tasks.size(),
    std::max< std::size_t >( options_.max_concurrency, 1 ) );

  if ( workers == 1 ) {
    worker();
  }
  else {
    std::vector< std::thread > threads;
    threads.reserve( workers );
    try {
      for ( std::size_t w = 0; w < workers; ++w ) threads.emplace_back( worker );
    } catch ( ... ) {
      stop = true;
      for ( auto& t : threads ) t.join();
      throw;
    }
    for ( auto& t : threads ) t.join();
  }

  if ( fatal ) std::rethrow_exception( fatal );
}

inline converge::ReconciliationReport
  converge::Reconciler::assemble_report() const
{
  ReconciliationReport report;
  report.cancelled = session_->cancelled.load();
  report.entries = session_->drift_entries;
  for ( const auto& r : session_->results ) {
    report.entries.push_back( r.entry );
    if ( r.options_entry ) report.entries.push_back( *r.options_entry );
  }
  return report;
}

inline bool converge::Reconciler::cancel_requested() const {
  return options_.cancel && options_.cancel->load();
}

inline converge::KeyedMutex::Guard converge::Reconciler::acquire(
  const std::string& configuration_id )
{
  if ( options_.wait_for_in_flight ) return locks_->lock( configuration_id );
  return locks_->try_lock( configuration_id );
}

inline void converge::Reconciler::execute( const Task& task ) {
  const Operation& op = session_->plan[ task.index ];
  OperationResult& result = session_->results[ task.index ];
  const bool second_half = ( op.kind == OperationKind::Recreate
    && task.phase == Phase::Build );

  if ( cancel_requested() ) {
    session_->cancelled = true;
    internal::mark_skipped( result.entry, second_half
      ? "old instance deleted; cancelled before create" : "cancelled" );
    return;
  }

  KeyedMutex::Guard guard = this->acquire( op.configuration_id );
  if ( !guard ) {
    internal::mark_skipped( result.entry, second_half
      ? "old instance deleted; another operation is in flight"
      : "another operation is in flight" );
    return;
  }

  if ( !this->state_unchanged(op, task.phase) ) {
    spdlog::warn( "Entry {} was changed by a concurrent pass",
      op.configuration_id );
    internal::mark_skipped( result.entry, second_half
      ? "old instance deleted; state changed by a concurrent pass"
      : "state changed by a concurrent pass" );
    return;
  }

  switch ( op.kind ) {
    case OperationKind::Delete:
      spdlog::info( "Removing entry {}", op.configuration_id );
      this->remove_instance( op.configuration_id, result.entry );
      break;

    case OperationKind::Create:
      spdlog::info( "Creating entry {} for platform {}", op.configuration_id,
        op.item->platform );
      this->create_instance( op, result );
      break;

    case OperationKind::Recreate:
      if ( task.phase == Phase::Teardown ) {
        spdlog::info( "Recreating entry {}", op.configuration_id );
        result.teardown_done = this->remove_instance( op.configuration_id,
          result.entry );
      }
      else if ( !this->create_instance(op, result) ) {
        spdlog::error( "Entry {} was deleted but could not be created again",
          op.configuration_id );
      }
      break;

    case OperationKind::UpdateOptions:
      spdlog::info( "Configuring entry {}", op.configuration_id );
      this->update_options( op, result );
      break;

    case OperationKind::NoOp:
      break;
  }

  if ( result.entry.outcome == Outcome::Error ) {
    spdlog::error( "{} {} failed: {}", to_string(op.kind),
      op.configuration_id, result.entry.detail );
  }
}

// The plan was computed from the snapshot. Another pass sharing the locks
// may have written the id since; called with the id's lock held.
inline bool converge::Reconciler::state_unchanged( const Operation& op,
  Phase phase )
{
  std::optional< StoredRecord > expected;
  const bool second_half = ( op.kind == OperationKind::Recreate
    && phase == Phase::Build );
  if ( !second_half ) {
    auto it = session_->snapshot.find( op.configuration_id );
    if ( it != session_->snapshot.end() ) expected = it->second;
  }
  return store_.get( op.configuration_id ) == expected;
}

template < typename Fn >
inline bool converge::Reconciler::attempt( ReportEntry& entry, Fn&& fn ) {
  try {
    fn();
    return true;
  }
  catch ( const StoreError& ) {
    throw;
  }
  catch ( const ValidationError& ex ) {
    internal::mark_error( entry, ErrorKind::Validation, ex.what() );
  }
  catch ( const ConflictError& ex ) {
    internal::mark_error( entry, ErrorKind::Conflict, ex.what() );
  }
  catch ( const NotFoundError& ex ) {
    internal::mark_error( entry, ErrorKind::NotFound, ex.what() );
  }
  catch ( const TransientError& ex ) {
    internal::mark_error( entry, ErrorKind::Transient, ex.what() );
  }
  catch ( const std::exception& ex ) {
    internal::mark_error( entry, ErrorKind::Internal, ex.what() );
  }
  return false;
}

// Deletes the live instance of a stored record, then the record itself.
// An instance that is already gone counts as deleted.
inline bool converge::Reconciler::remove_instance(
  const std::string& configuration_id, ReportEntry& entry )
{
  const StoredRecord& record = session_->snapshot.at( configuration_id );

  if ( record.instance_handle.empty() ) {
    entry.detail = "no live instance recorded";
  }
  else {
    bool already_removed = false;
    const bool ok = this->attempt( entry, [&]() {
      try {
        stepper_.remove( record.instance_handle );
      } catch ( const NotFoundError& ) {
        already_removed = true;
      }
    } );
    if ( !ok ) return false;
    if ( already_removed ) {
      spdlog::debug( "Instance {} of {} was already removed",
        record.instance_handle, configuration_id );
      entry.detail = "already removed";
    }
  }

  store_.remove( configuration_id );
  return true;
}

inline bool converge::Reconciler::create_instance( const Operation& op,
  OperationResult& result )
{
  const DesiredItem& d = *op.item;

  InstanceHandle handle;
  const bool ok = this->attempt( result.entry, [&]() {
    handle = stepper_.begin( d.platform, d.answers );
  } );
  if ( !ok ) return false;

  StoredRecord record;
  record.platform = d.platform;
  record.answers_fingerprint = op.answers_fingerprint;
  record.options_fingerprint = session_->empty_options_fingerprint;
  record.instance_handle = handle;
  store_.save( op.configuration_id, record );

  spdlog::debug( "Entry {} is instance {}", op.configuration_id, handle );
  if ( result.entry.detail.empty() ) result.entry.detail = "instance " + handle;
  else result.entry.detail += "; instance " + handle;

  this->apply_initial_options( op, std::move(record), result );
  return true;
}

// Options after a fresh setup are best effort: a failure is reported as its
// own entry and the new instance stays
inline void converge::Reconciler::apply_initial_options( const Operation& op,
  StoredRecord record, OperationResult& result )
{
  const DesiredItem& d = *op.item;
  if ( d.options.empty() ) return;

  ReportEntry entry;
  entry.configuration_id = op.configuration_id;
  entry.operation = OperationKind::UpdateOptions;

  bool supported = false;
  if ( this->attempt(entry, [&]() {
    supported = stepper_.supports_options( record.instance_handle );
  }) ) {
    if ( !supported ) {
      spdlog::warn( "Platform {} does not support options", d.platform );
      internal::mark_skipped( entry, "unsupported" );
    }
    else if ( this->attempt(entry, [&]() {
      stepper_.update_options( record.instance_handle, d.options );
    }) ) {
      record.options_fingerprint = op.options_fingerprint;
      store_.save( op.configuration_id, record );
    }
  }
  result.options_entry = entry;
}

inline void converge::Reconciler::update_options( const Operation& op,
  OperationResult& result )
{
  StoredRecord record = session_->snapshot.at( op.configuration_id );

  // Nothing to patch: options are partial, so dropping them from the
  // document leaves the external values as they are
  if ( op.options.empty() ) {
    record.options_fingerprint = op.options_fingerprint;
    store_.save( op.configuration_id, record );
    result.entry.detail = "no options declared; external values unchanged";
    return;
  }

  bool supported = false;
  if ( !this->attempt(result.entry, [&]() {
    supported = stepper_.supports_options( record.instance_handle );
  }) ) return;

  if ( !supported ) {
    spdlog::warn( "Platform {} does not support options", record.platform );
    internal::mark_skipped( result.entry, "unsupported" );
    return;
  }

  if ( !this->attempt(result.entry, [&]() {
    stepper_.update_options( record.instance_handle, op.options );
  }) ) return;

  record.options_fingerprint = op.options_fingerprint;
  store_.save( op.configuration_id, record );
}
