#include "detector/hysteresis_engine.hpp"

namespace coresidency::detector {

namespace {

void ResetCounters(HostState& host) {
  host.flag_count = 0;
  host.deflag_count = 0;
}

bool ReachedInclusion(const HostState& host, const config::Configuration& configuration) {
  if (configuration.samples_before_inclusion == config::kRequireFullWindow) {
    return host.window.Full() && host.window.ActiveCount() == host.window.Size();
  }
  return host.consecutive_active >= configuration.samples_before_inclusion;
}

bool ReachedExclusion(const HostState& host, const config::Configuration& configuration) {
  if (configuration.samples_before_exclusion == config::kRequireFullWindow) {
    return host.window.Full() && host.window.ActiveCount() == 0U;
  }
  return host.consecutive_inactive >= configuration.samples_before_exclusion;
}

} // namespace

const char* ToString(const MitigationTransition transition) {
  switch (transition) {
  case MitigationTransition::kNone:
    return "none";
  case MitigationTransition::kStart:
    return "start";
  case MitigationTransition::kStop:
    return "stop";
  }
  return "none";
}

const char* ToString(const InclusionChange change) {
  switch (change) {
  case InclusionChange::kNone:
    return "none";
  case InclusionChange::kIncluded:
    return "included";
  case InclusionChange::kExcluded:
    return "excluded";
  }
  return "none";
}

MitigationTransition ApplyVerdict(HostState& host, const bool over_threshold,
                                  const config::Configuration& configuration) {
  if (!configuration.mitigation_enabled) {
    return MitigationTransition::kNone;
  }

  if (!host.mitigating) {
    if (!over_threshold) {
      return MitigationTransition::kNone;
    }
    SaturatingIncrement(host.flag_count);
    host.deflag_count = 0;
    if (host.flag_count < configuration.flags_before_activation) {
      return MitigationTransition::kNone;
    }
    host.mitigating = true;
    ResetCounters(host);
    return MitigationTransition::kStart;
  }

  if (over_threshold) {
    host.deflag_count = 0;
    return MitigationTransition::kNone;
  }
  SaturatingIncrement(host.deflag_count);
  if (host.deflag_count < configuration.deflags_before_deactivation) {
    return MitigationTransition::kNone;
  }
  host.mitigating = false;
  ResetCounters(host);
  return MitigationTransition::kStop;
}

InclusionChange UpdateExclusion(HostState& host, const config::Configuration& configuration) {
  if (!host.included || !ReachedExclusion(host, configuration)) {
    return InclusionChange::kNone;
  }
  host.included = false;
  return InclusionChange::kExcluded;
}

InclusionChange UpdateInclusion(HostState& host, const config::Configuration& configuration) {
  if (host.included || !ReachedInclusion(host, configuration)) {
    return InclusionChange::kNone;
  }
  host.included = true;
  return InclusionChange::kIncluded;
}

} // namespace coresidency::detector
