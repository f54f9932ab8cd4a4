#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ipt/model.hpp"

namespace ipt {

// times から min/avg/max を算出。空なら std::nullopt
std::optional<LatencyStats> aggregate_times(const std::vector<double>& times);

// Pure fold of an attempt sequence into a ProbeResult: counts, status
// (Reachable iff at least one success) and latency over successes only.
// Resolution fields are left for the caller.
ProbeResult aggregate(const Target& target, const std::vector<ProbeAttempt>& attempts);

// Result for input the validator rejected; no attempts were made.
ProbeResult invalid_target_result(const std::string& raw, const std::string& reason);

} // namespace ipt
