#pragma once

#include "config/configuration.hpp"
#include "core/errors/detector_error.hpp"
#include "metrics/metric_value.hpp"

#include <map>
#include <string>
#include <string_view>

namespace coresidency::detector {

using HostId = std::string;

// One round of observations: host ID -> metric map. std::map keeps host
// iteration order stable so replaying a batch sequence is deterministic.
using SampleBatch = std::map<HostId, metrics::MetricMap>;

// Structural and configuration checks run before a batch touches any host
// state.
//
// Fails with INVALID_SAMPLE_BATCH when:
// - a host ID is empty
// - a metric map lacks Activity or Activity is not 0/1
// - metric key sets differ between hosts
// - any value is not finite
//
// Fails with CONFIGURATION_MISMATCH when mitigation is enabled and a
// non-Activity metric has no configured threshold. `error.subject` names the
// metric.
bool ValidateSampleBatch(const SampleBatch& batch, const config::Configuration& configuration,
                         core::errors::DetectorError& error);

// Decodes one JSON object `{"<host>": {"<metric>": <number|bool>, ...}, ...}`.
// Booleans map to 1/0 so activity can be reported as true/false. Any decoding
// failure is INVALID_SAMPLE_BATCH.
bool DecodeSampleBatchJson(std::string_view json_text, SampleBatch& batch,
                           core::errors::DetectorError& error);

} // namespace coresidency::detector
