#include "shakemap_service.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "internal/cache/event_cache.hpp"
#include "internal/observability/spans.hpp"
#include "internal/overlay/simulator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "request_params.hpp"

namespace shakemap::service {

using shakemap::v1::ShakemapResult;

namespace {

bool IsSimulateMode(const google::protobuf::Struct& body) {
  const auto it = body.fields().find("mode");
  return it != body.fields().end() && it->second.kind_case() == google::protobuf::Value::kStringValue && it->second.string_value() == "simulate";
}

} // namespace

ShakemapService::ShakemapService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.cache || !ctx_.simulator) {
    throw std::invalid_argument("ShakemapService requires a cache and a simulator");
  }
}

std::shared_ptr<const ShakemapResult> ShakemapService::Run(bool force) {
  observability::SpanScope span("ShakemapService.Run");
  span.SetAttribute("force", static_cast<std::int64_t>(force));

  auto entry = ctx_.cache->GetOrCompute(force);
  span.SetAttribute("event_key", entry->event_key);
  // Aliasing pointer keeps the whole entry alive with the result.
  return std::shared_ptr<const ShakemapResult>(entry, entry->result.get());
}

std::shared_ptr<const ShakemapResult> ShakemapService::Run(const google::protobuf::Struct& body) {
  if (IsSimulateMode(body)) {
    return std::make_shared<const ShakemapResult>(Simulate(&body));
  }
  return Run(FlagField(body, "force"));
}

google::protobuf::Struct ShakemapService::Refresh() {
  observability::SpanScope span("ShakemapService.Refresh");

  const auto entry = ctx_.cache->GetOrCompute(true);

  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  fields["ok"]                    = util::BoolValue(true);
  fields["meta"]                  = util::ToValue(entry->result->meta());
  fields["event_key"]             = util::StringValue(entry->event_key);
  return out;
}

google::protobuf::Struct ShakemapService::CacheState() const {
  const auto summary = ctx_.cache->PeekState();
  const auto stats   = ctx_.cache->Stats();

  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  fields["has_cache"]             = util::BoolValue(summary.has_cache);
  fields["event_key"]             = summary.event_key ? util::StringValue(*summary.event_key) : util::NullValue();
  fields["ts"]                    = util::NumberValue(summary.stored_at ? util::ToUnixSeconds(*summary.stored_at) : 0.0);
  fields["ttl_sec"]               = summary.ttl ? util::NumberValue(static_cast<double>(summary.ttl->count())) : util::NullValue();

  google::protobuf::Value stats_value;
  auto&                   counters = *stats_value.mutable_struct_value()->mutable_fields();
  counters["hits"]                 = util::NumberValue(static_cast<double>(stats.hits));
  counters["misses"]               = util::NumberValue(static_cast<double>(stats.misses));
  counters["coalesced"]            = util::NumberValue(static_cast<double>(stats.coalesced));
  counters["computations"]         = util::NumberValue(static_cast<double>(stats.computations));
  counters["failures"]             = util::NumberValue(static_cast<double>(stats.failures));
  fields["stats"]                  = std::move(stats_value);
  return out;
}

ShakemapResult ShakemapService::Simulate(const google::protobuf::Struct* body) const {
  observability::SpanScope span("ShakemapService.Simulate");
  if (!body) {
    throw util::ParameterError("request body is required");
  }
  return ctx_.simulator->Simulate(ParseSimulationParams(*body));
}

} // namespace shakemap::service
