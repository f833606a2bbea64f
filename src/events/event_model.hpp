#pragma once

#include "config/configuration.hpp"

#include <cstdint>
#include <string>

namespace coresidency::events {

// Logical events exchanged on the bus. Wire names come from the active
// configuration so deployments can rename them.
enum class EventType {
  kSampleEvent,
  kStartMitigation,
  kStopMitigation,
  kConfigurationReloaded,
};

// Identifier as spelled under `EventNames` in the configuration file.
const char* ToLogicalName(EventType event_type);

const std::string& WireName(const config::EventNames& names, EventType event_type);

// One mitigation decision as written to the CLI decision stream.
//
// - `batch`: 1-based index of the batch that triggered the transition.
// - `event`: wire name of the emitted event.
// - `host`: host ID carried as payload.
struct DecisionRecord {
  std::uint64_t batch = 0;
  std::string event;
  std::string host;
};

// {"batch":<n>,"event":"<wire name>","host":"<host>"}
std::string ToJson(const DecisionRecord& record);

} // namespace coresidency::events
