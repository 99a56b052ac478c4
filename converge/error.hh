// Exception taxonomy shared by the stepper boundary, the state store and
// the desired-state document loader
#pragma once

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace converge {

  // Base class for every error raised by this library
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // The stepper rejected the answers or options of one setup step. The
  // message names the step (zero-based) and field so it can be surfaced
  // to the operator unchanged.
  class ValidationError : public Error {
  public:
    inline ValidationError( const std::string& message,
      std::string field = std::string(),
      std::optional< std::size_t > step = std::nullopt )
      : Error( compose(message, field, step) ), field_( std::move(field) ),
        step_( step ) {}

    inline const std::string& field() const { return field_; }
    inline std::optional< std::size_t > step() const { return step_; }

  private:
    std::string field_;
    std::optional< std::size_t > step_;

    static std::string compose( const std::string& message,
      const std::string& field, std::optional< std::size_t > step )
    {
      std::ostringstream oss;
      if ( step ) oss << "step " << *step;
      if ( !field.empty() ) {
        if ( step ) oss << ", ";
        oss << "field '" << field << '\'';
      }
      if ( step || !field.empty() ) oss << ": ";
      oss << message;
      return oss.str();
    }
  };

  // The target instance does not exist (anymore) in the external system
  class NotFoundError : public Error {
  public:
    using Error::Error;
  };

  // Network or host failure, timeouts included. The next pass retries.
  class TransientError : public Error {
  public:
    using Error::Error;
  };

  // The external system already tracks an equivalent instance that has no
  // local record (set up out-of-band). Never treated as success.
  class ConflictError : public Error {
  public:
    using Error::Error;
  };

  // Failure of the durable state store. Fatal for a whole reconciliation
  // pass.
  class StoreError : public Error {
  public:
    using Error::Error;
  };

  // Malformed desired-state document
  class DocumentError : public Error {
  public:
    using Error::Error;
  };

} // namespace converge
