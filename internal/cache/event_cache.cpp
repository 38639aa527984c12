#include "event_cache.hpp"

#include <stdexcept>
#include <utility>

#include "event_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/overlay/overlay_computer.hpp"
#include "internal/source/event_source.hpp"

namespace shakemap::cache {

namespace {

std::optional<std::chrono::seconds> NormalizeTtl(std::optional<std::chrono::seconds> ttl) {
  if (ttl && ttl->count() <= 0) {
    return std::nullopt;
  }
  return ttl;
}

} // namespace

EventCache::EventCache(std::shared_ptr<source::EventSource> source, std::shared_ptr<const overlay::OverlayComputer> computer,
                       std::optional<std::chrono::seconds> ttl, ClockFn clock)
    : source_(std::move(source)), computer_(std::move(computer)), ttl_(NormalizeTtl(ttl)), clock_(std::move(clock)) {
  if (!source_ || !computer_) {
    throw std::invalid_argument("EventCache requires an event source and an overlay computer");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

std::shared_ptr<const CacheEntry> EventCache::Snapshot() const {
  std::shared_lock lock(state_mutex_);
  return state_;
}

bool EventCache::IsValid(const CacheEntry* entry) const {
  if (!entry) {
    return false;
  }
  if (!ttl_) {
    return true;
  }
  return clock_() - entry->stored_at < *ttl_;
}

// ------------------------------------------------------------
// GetOrCompute
// ------------------------------------------------------------

std::shared_ptr<const CacheEntry> EventCache::GetOrCompute(bool force) {
  if (!force) {
    auto entry = Snapshot();
    if (IsValid(entry.get())) {
      ++hits_;
      observability::Metrics::Instance().RecordCacheLookup("hit");
      return entry;
    }
  }

  std::lock_guard lock(compute_mutex_);

  if (!force) {
    // another caller may have refreshed while we waited
    auto entry = Snapshot();
    if (IsValid(entry.get())) {
      ++coalesced_;
      observability::Metrics::Instance().RecordCacheLookup("coalesced");
      return entry;
    }
    ++misses_;
    observability::Metrics::Instance().RecordCacheLookup("miss");
  }

  return ComputeAndStore();
}

std::shared_ptr<const CacheEntry> EventCache::ComputeAndStore() {
  observability::SpanScope span("EventCache.ComputeAndStore");
  observability::Stopwatch stopwatch;

  try {
    const auto meta = source_->FetchLatest();
    span.AddEvent("event fetched");
    auto result = std::make_shared<shakemap::v1::ShakemapResult>(computer_->Compute(meta));

    auto entry       = std::make_shared<CacheEntry>();
    entry->event_key = MakeEventKey(result->meta());
    entry->stored_at = clock_();
    entry->result    = std::move(result);

    {
      std::unique_lock state_lock(state_mutex_);
      state_ = entry;
    }
    ++computations_;

    const double elapsed_ms = stopwatch.ElapsedMs();
    observability::Metrics::Instance().ObserveComputeDurationMs("latest", elapsed_ms);
    span.SetAttribute("event_key", entry->event_key);
    span.SetAttribute("elapsed_ms", elapsed_ms);
    SHAKEMAP_LOG_INFO("Cache refreshed", {observability::StringField("event_key", entry->event_key),
                                          observability::DoubleField("elapsed_ms", elapsed_ms)});
    return entry;
  } catch (const std::exception& e) {
    ++failures_;
    span.RecordException(e.what());
    SHAKEMAP_LOG_WARN("Cache refresh failed, keeping previous state", {observability::StringField("error", e.what())});
    throw;
  }
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

CacheStateSummary EventCache::PeekState() const {
  CacheStateSummary summary;
  summary.ttl = ttl_;

  const auto entry = Snapshot();
  if (entry) {
    summary.has_cache = true;
    summary.event_key = entry->event_key;
    summary.stored_at = entry->stored_at;
  }
  return summary;
}

CacheStats EventCache::Stats() const {
  CacheStats stats;
  stats.hits         = hits_.load();
  stats.misses       = misses_.load();
  stats.coalesced    = coalesced_.load();
  stats.computations = computations_.load();
  stats.failures     = failures_.load();
  return stats;
}

} // namespace shakemap::cache
