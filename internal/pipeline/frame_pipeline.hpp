#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/util/time.hpp"

namespace fleetlink::protocol {
class ProtocolCodec;
}
namespace fleetlink::telemetry {
class TelemetryStore;
}
namespace fleetlink::mission {
class MissionDispatcher;
}

namespace fleetlink::pipeline {

struct PipelineCounters {
  uint64_t accepted  = 0;
  uint64_t duplicate = 0;
  uint64_t rejected  = 0; // decode failures
};

/*
  Inbound path of one broker frame:

      decode -> sequencing -> telemetry record + event window -> ack matching

  Malformed frames are counted, logged and dropped; nothing propagates to the
  network thread.
*/
class FramePipeline {
 public:
  FramePipeline(std::shared_ptr<protocol::ProtocolCodec> codec, std::shared_ptr<telemetry::TelemetryStore> telemetry,
                std::shared_ptr<mission::MissionDispatcher> dispatcher);

  void Handle(const std::string& topic, const std::string& payload, util::TimePoint arrived_at);

  PipelineCounters Counters() const;

 private:
  std::shared_ptr<protocol::ProtocolCodec>    codec_;
  std::shared_ptr<telemetry::TelemetryStore>  telemetry_;
  std::shared_ptr<mission::MissionDispatcher> dispatcher_;

  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> duplicate_{0};
  std::atomic<uint64_t> rejected_{0};
};

} // namespace fleetlink::pipeline
