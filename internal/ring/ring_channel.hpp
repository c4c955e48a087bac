#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/model/channel_kind.hpp"
#include "ring_consumer.hpp"
#include "ring_producer.hpp"
#include "shared_region.hpp"

namespace vigil::ring {

// Well-known shared memory name of a channel, "/<prefix>-<kind>".
std::string ChannelName(std::string_view prefix, model::ChannelKind kind);

/*
  One ring channel mapped into this process.

  The agent creates every channel and owns its name; producers attach with
  Open(). The channel hands out any number of producer views but owns the
  single consumer.
*/
class RingChannel {
 public:
  static std::unique_ptr<RingChannel> Create(model::ChannelKind kind, const std::string& name, std::uint32_t size);
  static std::unique_ptr<RingChannel> Open(model::ChannelKind kind, const std::string& name);
  static std::unique_ptr<RingChannel> CreateAnonymous(model::ChannelKind kind, std::uint32_t size);

  RingChannel(const RingChannel&)            = delete;
  RingChannel& operator=(const RingChannel&) = delete;

  RingProducer Producer() const {
    return RingProducer(header_, data_);
  }

  RingConsumer& Consumer() {
    return consumer_;
  }

  const RingConsumer& Consumer() const {
    return consumer_;
  }

  model::ChannelKind Kind() const {
    return kind_;
  }

  const std::string& Name() const {
    return region_.Name();
  }

  std::uint32_t Size() const {
    return header_->size;
  }

  std::uint32_t UsedBytes() const;
  std::uint32_t Dropped() const;

  // Test hook: direct access to the shared header.
  RingHeader* Header() const {
    return header_;
  }

 private:
  RingChannel(model::ChannelKind kind, SharedRegion region, bool initialize);

  model::ChannelKind kind_;
  SharedRegion       region_;
  RingHeader*        header_;
  std::uint8_t*      data_;
  RingConsumer       consumer_;
};

} // namespace vigil::ring
