#pragma once

#include <memory>

#include <google/protobuf/struct.pb.h>

#include "service_context.hpp"
#include "shakemap/v1.hpp"

namespace shakemap::service {

/*
  Request-level operations behind the HTTP routes. Everything here is
  safe to call from many worker threads at once; coordination lives in
  the event cache.
*/
class ShakemapService {
 public:
  explicit ShakemapService(ServiceContext ctx);

  // Cached overlay, recomputed when missing, stale or forced.
  std::shared_ptr<const shakemap::v1::ShakemapResult> Run(bool force);

  // {"mode": "simulate", ...} runs the simulator, anything else reads
  // the optional "force" flag.
  std::shared_ptr<const shakemap::v1::ShakemapResult> Run(const google::protobuf::Struct& body);

  // {"ok": true, "meta": {...}, "event_key": "..."} of the new entry.
  google::protobuf::Struct Refresh();

  // {"has_cache", "event_key", "ts", "ttl_sec", "stats"}; never computes.
  google::protobuf::Struct CacheState() const;

  // body is required; nullptr throws util::ParameterError.
  shakemap::v1::ShakemapResult Simulate(const google::protobuf::Struct* body) const;

 private:
  ServiceContext ctx_;
};

} // namespace shakemap::service
