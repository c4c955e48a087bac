#include "admin_service.hpp"

#include <chrono>

#include "internal/model/channel_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/ingest_pipeline.hpp"
#include "internal/store/store_writer.hpp"

namespace vigil::service {

using namespace vigil::agent::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  vigil::observability::SpanScope span("AdminService.Stats");
  const auto                      started_at = std::chrono::steady_clock::now();

  try {
    StatsResponse resp;

    if (ctx_.pipeline) {
      for (const auto& stats : ctx_.pipeline->Stats()) {
        auto* channel = resp.add_channels();
        channel->set_kind(std::string(vigil::model::ToString(stats.kind)));
        channel->set_name(stats.name);
        channel->set_size_bytes(stats.size_bytes);
        channel->set_used_bytes(stats.used_bytes);
        channel->set_dropped(stats.dropped);
        channel->set_frames(stats.frames);
        channel->set_desyncs(stats.desyncs);
        channel->set_decode_errors(stats.decode_errors);
      }
      resp.set_pending_events(ctx_.pipeline->PendingEvents());
    }

    if (ctx_.writer) {
      const auto stats  = ctx_.writer->Stats();
      auto*      writer = resp.mutable_writer();
      writer->set_state(vigil::store::ToString(stats.state));
      writer->set_queued_events(stats.queued_events);
      writer->set_dropped_events(stats.dropped_events);
      writer->set_batches_written(stats.batches_written);
      writer->set_events_written(stats.events_written);
      writer->set_write_failures(stats.write_failures);
      writer->set_checkpoints(stats.checkpoints);
      writer->set_checkpoint_failures(stats.checkpoint_failures);
      writer->set_forced_checkpoints(stats.forced_checkpoints);
      writer->set_retention_deleted(stats.retention_deleted);
      writer->set_wal_size_bytes(stats.wal_size_bytes);
    }

    vigil::observability::Metrics::Instance().RecordRequest("AdminService.Stats", true);
    vigil::observability::Metrics::Instance().ObserveRequestLatencyMs(
        "AdminService.Stats", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    VIGIL_LOG_ERROR("RPC failed",
                    {vigil::observability::StringField("route", "AdminService.Stats"), vigil::observability::StringField("error", ex.what())});
    vigil::observability::Metrics::Instance().RecordRequest("AdminService.Stats", false);
    vigil::observability::Metrics::Instance().ObserveRequestLatencyMs(
        "AdminService.Stats", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace vigil::service
