#pragma once

#include <functional>
#include <vector>

#include "internal/model/channel_kind.hpp"
#include "internal/model/event.hpp"

namespace vigil::pipeline {

// Events bound for one table, in arrival order.
struct EventBatch {
  model::ChannelKind       kind = model::ChannelKind::kFilesystem;
  std::vector<model::Event> events;
};

using BatchSink = std::function<void(EventBatch&&)>;

} // namespace vigil::pipeline
