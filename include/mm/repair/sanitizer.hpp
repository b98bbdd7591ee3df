#pragma once

#include "mm/repair/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mm::repair
{

// Repairs the catalogued syntax defects of AI generated Mermaid flowcharts.
//
// Only flowchart/graph diagrams are touched; any other dialect, empty input,
// or input the scanner cannot follow comes back Unchanged with the original
// text. The function is total, keeps no state between calls and is safe to
// call concurrently. Sanitizing a Fixed text again always yields Unchanged.
SanitizeResult sanitize(std::string_view source);
SanitizeResult sanitize(std::string_view source, const SanitizerOptions &options);

// Byte-for-byte comparison of the rebuilt text against the input. Identical
// text collapses to Unchanged and drops |repairs|.
SanitizeResult detectChanges(std::string_view original, std::string rebuilt, std::vector<RepairRecord> repairs);

} // namespace mm::repair
