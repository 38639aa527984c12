#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "internal/util/time.hpp"
#include "shakemap/v1/shakemap.pb.h"

namespace shakemap::source {
class EventSource;
}
namespace shakemap::overlay {
class OverlayComputer;
}

namespace shakemap::cache {

/*
  One published cache generation. Immutable once built; the cache swaps
  whole entries, so result, key and timestamp always belong together.
*/
struct CacheEntry {
  std::shared_ptr<const shakemap::v1::ShakemapResult> result;
  std::string                                         event_key;
  util::TimePoint                                     stored_at;
};

struct CacheStateSummary {
  bool                                has_cache{false};
  std::optional<std::string>          event_key;
  std::optional<util::TimePoint>      stored_at;
  std::optional<std::chrono::seconds> ttl;
};

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t coalesced{0};
  uint64_t computations{0};
  uint64_t failures{0};
};

/*
  Single-slot cache of the latest-event overlay.

  Consistency model:
  - GetOrCompute(false) serves a valid entry without touching
    compute_mutex_; the entry pointer is read under a shared lock.
  - Misses and forced refreshes serialize on compute_mutex_. Non-forced
    callers re-check validity after acquiring it, so a burst of misses
    runs the event source and overlay computer once.
  - Forced callers always recompute, last writer wins.
  - A failed computation leaves the published entry untouched.
*/
class EventCache {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  EventCache(std::shared_ptr<source::EventSource> source, std::shared_ptr<const overlay::OverlayComputer> computer,
             std::optional<std::chrono::seconds> ttl, ClockFn clock = util::Now);

  EventCache(const EventCache&)            = delete;
  EventCache& operator=(const EventCache&) = delete;

  std::shared_ptr<const CacheEntry> GetOrCompute(bool force);

  CacheStateSummary PeekState() const;
  CacheStats        Stats() const;

  const std::optional<std::chrono::seconds>& ttl() const {
    return ttl_;
  }

 private:
  std::shared_ptr<const CacheEntry> Snapshot() const;
  bool                              IsValid(const CacheEntry* entry) const;

  // Caller holds compute_mutex_.
  std::shared_ptr<const CacheEntry> ComputeAndStore();

  std::shared_ptr<source::EventSource>            source_;
  std::shared_ptr<const overlay::OverlayComputer> computer_;
  const std::optional<std::chrono::seconds>       ttl_;
  ClockFn                                         clock_;

  // Guards only the pointer, never held across a computation.
  mutable std::shared_mutex         state_mutex_;
  std::shared_ptr<const CacheEntry> state_;

  std::mutex compute_mutex_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> coalesced_{0};
  std::atomic<uint64_t> computations_{0};
  std::atomic<uint64_t> failures_{0};
};

} // namespace shakemap::cache
