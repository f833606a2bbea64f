#include "events/event_model.hpp"

#include "core/json_utils.hpp"

namespace coresidency::events {

const char* ToLogicalName(const EventType event_type) {
  switch (event_type) {
  case EventType::kSampleEvent:
    return "SampleEvent";
  case EventType::kStartMitigation:
    return "StartMitigation";
  case EventType::kStopMitigation:
    return "StopMitigation";
  case EventType::kConfigurationReloaded:
    return "ConfigurationReloaded";
  }

  return "unknown";
}

const std::string& WireName(const config::EventNames& names, const EventType event_type) {
  const config::WireNameField field = config::FindWireNameField(ToLogicalName(event_type));
  return field != nullptr ? names.*field : names.sample_event;
}

std::string ToJson(const DecisionRecord& record) {
  return "{\"batch\":" + std::to_string(record.batch) + ",\"event\":\"" +
         core::EscapeJson(record.event) + "\",\"host\":\"" + core::EscapeJson(record.host) +
         "\"}";
}

} // namespace coresidency::events
