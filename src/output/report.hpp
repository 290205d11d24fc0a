#pragma once

#include "apply/apply_diff.hpp"

#include <string>
#include <vector>

namespace mender {

// Human-readable summary of a call: totals, every failed block with its
// reason, candidate locations and search preview, then the warnings.
std::vector<std::string>
render_report(const ApplyDiffResult& result);

// One line per telemetry entry. Empty when telemetry was not collected.
std::vector<std::string>
render_telemetry(const ApplyDiffResult& result);

std::vector<std::string>
render_error(const ApplyError& error);

}  // namespace mender
