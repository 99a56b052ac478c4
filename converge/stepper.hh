// Boundary to the external setup protocol. A concrete Stepper drives a
// connector's multi-step question/answer negotiation and owns whatever
// timeout and retry policy that protocol needs.
#pragma once

#include <string>

#include "converge/node.hh"
#include "converge/types.hh"

namespace converge {

  // Error contract (see converge/error.hh):
  //   begin           ValidationError naming the step and field, or
  //                   ConflictError when the external system already tracks
  //                   an equivalent instance, or TransientError
  //   remove          NotFoundError when the instance is already gone
  //   update_options  ValidationError, NotFoundError, TransientError
  //
  // With ReconcilerOptions::max_concurrency > 1 the methods are called from
  // several threads at once, never twice concurrently for one instance.
  class Stepper {
  public:
    virtual ~Stepper() = default;

    // Runs the setup protocol with the full ordered answers sequence and
    // returns the handle of the new instance
    virtual InstanceHandle begin( const std::string& platform,
      const Steps& answers ) = 0;

    virtual void remove( const InstanceHandle& handle ) = 0;

    // Applies a partial options mapping per step. Keys that are not given
    // keep their current external value.
    virtual void update_options( const InstanceHandle& handle,
      const Steps& options ) = 0;

    virtual bool supports_options( const InstanceHandle& handle ) = 0;

    // Drift check. Returning false means the instance was removed
    // out-of-band and the stored record is stale.
    virtual bool instance_exists( const InstanceHandle& /*handle*/ ) {
      return true;
    }
  };

} // namespace converge
