// Per-key mutual exclusion: one lock slot per configuration id, created on
// demand and dropped once nobody holds or waits for it
#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace converge {

  class KeyedMutex {
  private:
    struct Slot {
      std::condition_variable released;
      bool held = false;
      std::size_t users = 0; // holders plus waiters
    };

  public:
    // Releases the key on destruction
    class Guard {
    public:
      Guard() = default;
      inline Guard( Guard&& other ) noexcept
        : owner_( other.owner_ ), key_( std::move(other.key_) ),
          slot_( other.slot_ )
      {
        other.owner_ = nullptr;
        other.slot_ = nullptr;
      }
      inline Guard& operator=( Guard&& other ) noexcept {
        if ( this != &other ) {
          release();
          owner_ = other.owner_;
          key_ = std::move( other.key_ );
          slot_ = other.slot_;
          other.owner_ = nullptr;
          other.slot_ = nullptr;
        }
        return *this;
      }
      Guard( const Guard& ) = delete;
      Guard& operator=( const Guard& ) = delete;
      inline ~Guard() { release(); }

      inline bool owns_lock() const { return slot_ != nullptr; }
      inline explicit operator bool() const { return owns_lock(); }

    private:
      friend class KeyedMutex;
      inline Guard( KeyedMutex* owner, std::string key, Slot* slot )
        : owner_( owner ), key_( std::move(key) ), slot_( slot ) {}

      void release();

      KeyedMutex* owner_ = nullptr;
      std::string key_;
      Slot* slot_ = nullptr;
    };

    // Blocks until the key is free
    Guard lock( const std::string& key );

    // Returns an empty guard if the key is currently held, by any thread
    Guard try_lock( const std::string& key );

    // Number of keys currently held or waited for
    std::size_t active_keys() const;

  private:
    mutable std::mutex table_mutex_;
    std::unordered_map< std::string, std::unique_ptr< Slot > > slots_;

    void release( const std::string& key );
  };

} // namespace converge

inline converge::KeyedMutex::Guard converge::KeyedMutex::lock(
  const std::string& key )
{
  std::unique_lock< std::mutex > table( table_mutex_ );
  auto& slot = slots_[ key ];
  if ( !slot ) slot = std::make_unique< Slot >();
  Slot* s = slot.get();
  s->users++;
  s->released.wait( table, [s]() { return !s->held; } );
  s->held = true;
  return Guard( this, key, s );
}

inline converge::KeyedMutex::Guard converge::KeyedMutex::try_lock(
  const std::string& key )
{
  std::lock_guard< std::mutex > table( table_mutex_ );
  auto& slot = slots_[ key ];
  if ( !slot ) slot = std::make_unique< Slot >();
  if ( slot->held ) return Guard();
  slot->held = true;
  slot->users++;
  return Guard( this, key, slot.get() );
}

inline std::size_t converge::KeyedMutex::active_keys() const {
  std::lock_guard< std::mutex > table( table_mutex_ );
  return slots_.size();
}

inline void converge::KeyedMutex::release( const std::string& key ) {
  std::lock_guard< std::mutex > table( table_mutex_ );
  auto it = slots_.find( key );
  if ( it == slots_.end() ) return;
  Slot& slot = *it->second;
  slot.held = false;
  if ( --slot.users == 0 ) slots_.erase( it );
  else slot.released.notify_one();
}

inline void converge::KeyedMutex::Guard::release() {
  if ( !slot_ ) return;
  owner_->release( key_ );
  slot_ = nullptr;
  owner_ = nullptr;
}
