#include "ring_channel.hpp"

#include <new>
#include <utility>

#include "internal/util/errors.hpp"

namespace vigil::ring {

namespace {

void CheckSize(std::uint32_t size) {
  if (size < kMinRingSize) {
    throw util::InvalidArgument("ring size must be at least " + std::to_string(kMinRingSize) + " bytes");
  }
}

RingHeader* HeaderOf(const SharedRegion& region) {
  return reinterpret_cast<RingHeader*>(region.Data());
}

} // namespace

std::string ChannelName(std::string_view prefix, model::ChannelKind kind) {
  std::string name = "/";
  name.append(prefix);
  name.push_back('-');
  name.append(model::ToString(kind));
  return name;
}

RingChannel::RingChannel(model::ChannelKind kind, SharedRegion region, bool initialize)
    : kind_(kind), region_(std::move(region)), header_(HeaderOf(region_)), data_(region_.Data() + kRingHeaderBytes),
      consumer_(header_, data_) {
  if (initialize) {
    const auto size = static_cast<std::uint32_t>(region_.Size() - kRingHeaderBytes);
    header_         = new (region_.Data()) RingHeader{};
    header_->head.store(0, std::memory_order_relaxed);
    header_->tail.store(0, std::memory_order_relaxed);
    header_->dropped.store(0, std::memory_order_relaxed);
    header_->size = size;
    std::atomic_thread_fence(std::memory_order_release);
  }
}

std::unique_ptr<RingChannel> RingChannel::Create(model::ChannelKind kind, const std::string& name, std::uint32_t size) {
  CheckSize(size);
  auto region = SharedRegion::Create(name, static_cast<std::size_t>(size) + kRingHeaderBytes);
  return std::unique_ptr<RingChannel>(new RingChannel(kind, std::move(region), true));
}

std::unique_ptr<RingChannel> RingChannel::Open(model::ChannelKind kind, const std::string& name) {
  auto region = SharedRegion::Open(name);
  if (region.Size() < kRingHeaderBytes + kMinRingSize) {
    throw util::InvalidState("shared region " + name + " is too small for a ring channel");
  }

  const auto* header = HeaderOf(region);
  if (static_cast<std::size_t>(header->size) + kRingHeaderBytes > region.Size()) {
    throw util::InvalidState("ring header of " + name + " declares a size beyond its mapping");
  }
  return std::unique_ptr<RingChannel>(new RingChannel(kind, std::move(region), false));
}

std::unique_ptr<RingChannel> RingChannel::CreateAnonymous(model::ChannelKind kind, std::uint32_t size) {
  CheckSize(size);
  auto region = SharedRegion::Anonymous(static_cast<std::size_t>(size) + kRingHeaderBytes);
  return std::unique_ptr<RingChannel>(new RingChannel(kind, std::move(region), true));
}

std::uint32_t RingChannel::UsedBytes() const {
  const std::uint32_t size = header_->size;
  const std::uint32_t head = header_->head.load(std::memory_order_acquire);
  const std::uint32_t tail = header_->tail.load(std::memory_order_acquire);
  if (head >= size || tail >= size) {
    return 0;
  }
  return ring::UsedBytes(head, tail, size);
}

std::uint32_t RingChannel::Dropped() const {
  return header_->dropped.load(std::memory_order_relaxed);
}

} // namespace vigil::ring
