#pragma once

#include <span>
#include <string_view>

namespace mm::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view usageSummary;
    std::string_view aboutDescription;
};

std::span<const ToolInfo> tools() noexcept;
// Matches either the tool id or its executable name.
const ToolInfo *findTool(std::string_view id) noexcept;
const ToolInfo &requireTool(std::string_view id);

} // namespace mm::appinfo
