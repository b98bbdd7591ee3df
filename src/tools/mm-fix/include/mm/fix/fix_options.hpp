#pragma once

#include "mm/options.hpp"
#include "mm/repair/types.hpp"

namespace mm::fix
{

inline constexpr const char *kOptionEnabled = "enabled";
inline constexpr const char *kOptionExtraNodeTriggers = "extraNodeTriggers";
inline constexpr const char *kOptionExtraEdgeTriggers = "extraEdgeTriggers";
inline constexpr const char *kOptionReportFormat = "reportFormat";

// Environment variables read on top of stored defaults: MM_FIX_ENABLED, ...
inline constexpr const char *kEnvironmentPrefix = "MM_FIX";

void registerFixOptions(config::OptionRegistry &registry);
repair::SanitizerOptions sanitizerOptionsFrom(const config::OptionRegistry &registry);

} // namespace mm::fix
