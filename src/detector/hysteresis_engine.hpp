#pragma once

#include "config/configuration.hpp"
#include "detector/host_state.hpp"

namespace coresidency::detector {

// Outcome of one batch for one host's mitigation state.
enum class MitigationTransition {
  kNone,
  kStart,
  kStop,
};

const char* ToString(MitigationTransition transition);

// Flag/deflag state machine for an included host.
//
// Normal:     over threshold -> flag_count++, deflag_count = 0;
//             flag_count >= flags_before_activation -> kStart.
//             Not over threshold leaves both counters untouched.
// Mitigating: not over threshold -> deflag_count++; over -> deflag_count = 0;
//             deflag_count >= deflags_before_deactivation -> kStop.
// Every transition resets both counters.
//
// With mitigation disabled no counter moves and kNone is returned.
MitigationTransition ApplyVerdict(HostState& host, bool over_threshold,
                                  const config::Configuration& configuration);

enum class InclusionChange {
  kNone,
  kIncluded,
  kExcluded,
};

const char* ToString(InclusionChange change);

// Included -> Excluded when consecutive_inactive >= samples_before_exclusion,
// or with -1 when the window is full and no retained sample is active.
// Runs before the batch's statistics, so a host that just went idle is
// neither averaged nor evaluated.
//
// Mitigation state is left alone: a mitigating host that drops out keeps
// mitigating until it is re-included and deflagged.
InclusionChange UpdateExclusion(HostState& host, const config::Configuration& configuration);

// Excluded -> Included when consecutive_active >= samples_before_inclusion, or
// with -1 when the window is full and every retained sample is active.
// Runs after the batch's statistics; the host counts from the next batch on.
InclusionChange UpdateInclusion(HostState& host, const config::Configuration& configuration);

} // namespace coresidency::detector
