// Durable record of the last-applied configuration per configuration id
#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "converge/error.hh"
#include "converge/node.hh"
#include "converge/types.hh"

namespace converge {

  // Keyed storage for StoredRecords. save() and remove() return only once
  // the change is durable. Implementations throw StoreError on failure.
  class StateStore {
  public:
    virtual ~StateStore() = default;

    virtual StoredState load() = 0;

    // Current record of one id, read from the durable state
    virtual std::optional< StoredRecord > get(
      const std::string& configuration_id )
    {
      StoredState all = load();
      auto it = all.find( configuration_id );
      if ( it == all.end() ) return std::nullopt;
      return it->second;
    }

    virtual void save( const std::string& configuration_id,
      const StoredRecord& record ) = 0;
    virtual void remove( const std::string& configuration_id ) = 0;
  };

  // Process-local store, for tests and plan-only runs
  class MemoryStateStore : public StateStore {
  public:
    MemoryStateStore() = default;
    inline explicit MemoryStateStore( StoredState initial )
      : records_( std::move(initial) ) {}

    StoredState load() override;
    std::optional< StoredRecord > get(
      const std::string& configuration_id ) override;
    void save( const std::string& configuration_id,
      const StoredRecord& record ) override;
    void remove( const std::string& configuration_id ) override;

  private:
    std::mutex mutex_;
    StoredState records_;
  };

  // YAML lock file:
  //
  //   version: 1
  //   entries:
  //     - configuration_id: office
  //       platform: broadlink
  //       instance_handle: 8c1e...
  //       answers_fingerprint: sha256:...
  //       options_fingerprint: sha256:...
  //
  // Every mutation rewrites the whole file through a temporary sibling that
  // is fsync'ed and renamed into place.
  class LockFileStore : public StateStore {
  public:
    static constexpr std::int64_t FORMAT_VERSION = 1;

    inline explicit LockFileStore( std::string path )
      : path_( std::move(path) ) {}

    inline const std::string& path() const { return path_; }

    StoredState load() override;
    std::optional< StoredRecord > get(
      const std::string& configuration_id ) override;
    void save( const std::string& configuration_id,
      const StoredRecord& record ) override;
    void remove( const std::string& configuration_id ) override;

  private:
    std::string path_;
    std::mutex mutex_;
    StoredState records_;
    bool loaded_ = false;

    StoredState read_file() const;
    void write_file() const;
    void ensure_loaded();
  };

namespace internal {

  inline const std::string LOCK_VERSION = "version";
  inline const std::string LOCK_ENTRIES = "entries";
  inline const std::string LOCK_ID = "configuration_id";
  inline const std::string LOCK_PLATFORM = "platform";
  inline const std::string LOCK_HANDLE = "instance_handle";
  inline const std::string LOCK_ANSWERS_FP = "answers_fingerprint";
  inline const std::string LOCK_OPTIONS_FP = "options_fingerprint";

  inline std::string errno_message( const std::string& what,
    const std::string& path )
  {
    return what + " '" + path + "': " + std::strerror( errno );
  }

  // Owns a POSIX file descriptor
  struct UniqueFd {
    int fd = -1;
    inline explicit UniqueFd( int f ) : fd( f ) {}
    UniqueFd( const UniqueFd& ) = delete;
    UniqueFd& operator=( const UniqueFd& ) = delete;
    inline ~UniqueFd() { if ( fd >= 0 ) ::close( fd ); }

    // Close explicitly so the error is not lost
    inline int release_and_close() {
      int rc = ::close( fd );
      fd = -1;
      return rc;
    }
  };

  inline ordered_node lock_document( const StoredState& records ) {
    ordered_node root = ordered_node::mapping();
    root[ LOCK_VERSION ] = make_node_from< std::int64_t >(
      LockFileStore::FORMAT_VERSION );

    std::vector< ordered_node > entries;
    entries.reserve( records.size() );
    for ( const auto& [id, record] : records ) {
      ordered_node e = ordered_node::mapping();
      e[ LOCK_ID ] = make_node_from( id );
      e[ LOCK_PLATFORM ] = make_node_from( record.platform );
      e[ LOCK_HANDLE ] = make_node_from( record.instance_handle );
      e[ LOCK_ANSWERS_FP ] = make_node_from( record.answers_fingerprint );
      e[ LOCK_OPTIONS_FP ] = make_node_from( record.options_fingerprint );
      entries.push_back( std::move(e) );
    }
    root[ LOCK_ENTRIES ] = make_node_from( entries );
    return root;
  }

  inline std::string lock_field( const ordered_node& entry,
    const std::string& key, const std::string& where )
  {
    if ( !entry.contains(key) || !entry.at(key).is_scalar()
      || entry.at(key).is_null() )
    {
      throw StoreError( where + ": missing or non-scalar '" + key + "'" );
    }
    return to_string_any( entry.at(key) );
  }

  inline StoredState parse_lock_document( const ordered_node& root,
    const std::string& origin )
  {
    StoredState out;
    if ( root.is_null() ) return out;
    if ( !root.is_mapping() ) {
      throw StoreError( origin + ": lock file root is not a mapping" );
    }

    if ( !root.contains(LOCK_VERSION) || !root.at(LOCK_VERSION).is_integer()
      || to_native_checked< std::int64_t >( root.at(LOCK_VERSION) )
        != LockFileStore::FORMAT_VERSION )
    {
      throw StoreError( origin + ": unsupported lock file version (expected "
        + std::to_string(LockFileStore::FORMAT_VERSION) + ")" );
    }

    if ( !root.contains(LOCK_ENTRIES) || root.at(LOCK_ENTRIES).is_null() ) {
      return out;
    }
    const ordered_node& entries = root.at( LOCK_ENTRIES );
    if ( !entries.is_sequence() ) {
      throw StoreError( origin + ": '" + LOCK_ENTRIES
        + "' is not a sequence" );
    }

    for ( std::size_t i = 0; i < entries.size(); ++i ) {
      const std::string where = origin + ": "
        + seq_indexed( LOCK_ENTRIES, i );
      const ordered_node& e = entries.at( i );
      if ( !e.is_mapping() ) throw StoreError( where + ": not a mapping" );

      const std::string id = lock_field( e, LOCK_ID, where );
      StoredRecord record;
      record.platform = lock_field( e, LOCK_PLATFORM, where );
      record.instance_handle = lock_field( e, LOCK_HANDLE, where );
      record.answers_fingerprint = lock_field( e, LOCK_ANSWERS_FP, where );
      record.options_fingerprint = lock_field( e, LOCK_OPTIONS_FP, where );

      if ( !out.emplace(id, std::move(record)).second ) {
        throw StoreError( where + ": duplicate configuration id '" + id
          + "'" );
      }
    }
    return out;
  }

} // namespace internal

} // namespace converge

// MemoryStateStore member function definitions

inline converge::StoredState converge::MemoryStateStore::load() {
  std::lock_guard< std::mutex > lock( mutex_ );
  return records_;
}

inline std::optional< converge::StoredRecord >
  converge::MemoryStateStore::get( const std::string& configuration_id )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  auto it = records_.find( configuration_id );
  if ( it == records_.end() ) return std::nullopt;
  return it->second;
}

inline void converge::MemoryStateStore::save(
  const std::string& configuration_id, const StoredRecord& record )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  records_[ configuration_id ] = record;
}

inline void converge::MemoryStateStore::remove(
  const std::string& configuration_id )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  records_.erase( configuration_id );
}

// LockFileStore member function definitions

// Reads the lock file from disk every time, so state written by an earlier
// process is always picked up
inline converge::StoredState converge::LockFileStore::load() {
  std::lock_guard< std::mutex > lock( mutex_ );
  records_ = read_file();
  loaded_ = true;
  return records_;
}

// Also re-reads the file, so a record written by another process is seen
inline std::optional< converge::StoredRecord >
  converge::LockFileStore::get( const std::string& configuration_id )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  records_ = read_file();
  loaded_ = true;
  auto it = records_.find( configuration_id );
  if ( it == records_.end() ) return std::nullopt;
  return it->second;
}

inline void converge::LockFileStore::save(
  const std::string& configuration_id, const StoredRecord& record )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  ensure_loaded();
  StoredState next = records_;
  next[ configuration_id ] = record;
  std::swap( records_, next );
  try {
    write_file();
  } catch ( const StoreError& ) {
    std::swap( records_, next );
    throw;
  }
}

inline void converge::LockFileStore::remove(
  const std::string& configuration_id )
{
  std::lock_guard< std::mutex > lock( mutex_ );
  ensure_loaded();
  if ( !records_.count(configuration_id) ) return;
  StoredState next = records_;
  next.erase( configuration_id );
  std::swap( records_, next );
  try {
    write_file();
  } catch ( const StoreError& ) {
    std::swap( records_, next );
    throw;
  }
}

inline void converge::LockFileStore::ensure_loaded() {
  if ( loaded_ ) return;
  records_ = read_file();
  loaded_ = true;
}

inline converge::StoredState converge::LockFileStore::read_file() const {
  std::error_code ec;
  if ( !std::filesystem::exists(path_, ec) ) {
    if ( ec ) throw StoreError( "cannot stat lock file '" + path_ + "': "
      + ec.message() );
    return {};
  }

  std::ifstream in( path_ );
  if ( !in ) {
    throw StoreError( internal::errno_message("cannot open lock file",
      path_) );
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if ( in.bad() ) {
    throw StoreError( internal::errno_message("cannot read lock file",
      path_) );
  }

  const std::string text = ss.str();
  if ( internal::is_blank(text) ) return {};

  ordered_node root;
  try {
    root = ordered_node::deserialize( text );
  } catch ( const fkyaml::exception& ex ) {
    throw StoreError( "malformed lock file '" + path_ + "': " + ex.what() );
  }
  return internal::parse_lock_document( root, path_ );
}

inline void converge::LockFileStore::write_file() const {
  const std::string text = ordered_node::serialize(
    internal::lock_document(records_) );
  const std::string tmp = path_ + ".tmp";

  {
    internal::UniqueFd out( ::open(tmp.c_str(),
      O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600) );
    if ( out.fd < 0 ) {
      throw StoreError( internal::errno_message("cannot create", tmp) );
    }

    std::size_t written = 0;
    while ( written < text.size() ) {
      ssize_t n = ::write( out.fd, text.data() + written,
        text.size() - written );
      if ( n < 0 ) {
        if ( errno == EINTR ) continue;
        const std::string msg = internal::errno_message( "cannot write",
          tmp );
        ::unlink( tmp.c_str() );
        throw StoreError( msg );
      }
      written += static_cast< std::size_t >( n );
    }

    if ( ::fsync(out.fd) != 0 || out.release_and_close() != 0 ) {
      const std::string msg = internal::errno_message( "cannot flush", tmp );
      ::unlink( tmp.c_str() );
      throw StoreError( msg );
    }
  }

  if ( ::rename(tmp.c_str(), path_.c_str()) != 0 ) {
    const std::string msg = internal::errno_message( "cannot replace",
      path_ );
    ::unlink( tmp.c_str() );
    throw StoreError( msg );
  }

  // Persist the rename itself
  std::filesystem::path dir = std::filesystem::path( path_ ).parent_path();
  if ( dir.empty() ) dir = ".";
  internal::UniqueFd dfd( ::open(dir.c_str(), O_RDONLY | O_DIRECTORY) );
  if ( dfd.fd < 0 || ::fsync(dfd.fd) != 0 ) {
    throw StoreError( internal::errno_message("cannot sync directory",
      dir.string()) );
  }
}
