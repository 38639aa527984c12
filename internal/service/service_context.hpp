#pragma once

#include <memory>

namespace shakemap::cache { class EventCache; }
namespace shakemap::overlay { class Simulator; }

namespace shakemap::service {

/*
  Dependency container shared by the request handlers.
*/
struct ServiceContext {
  std::shared_ptr<shakemap::cache::EventCache>  cache;
  std::shared_ptr<shakemap::overlay::Simulator> simulator;
};

} // namespace shakemap::service
