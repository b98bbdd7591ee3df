#include "mm/app_info.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace mm::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "mm-fix",
                "mm-fix",
                "Mermaid Fix",
                "Repair common syntax defects in AI generated Mermaid flowcharts.",
                "mm-fix [options] [FILE]",
                "Mermaid Fix rewrites flowchart source the way a careful reviewer would: labels with dots, colons or "
                "parentheses get quoted, escaped and nested quotes are flattened, empty edge labels and sentence-style "
                "trailing periods disappear. Anything it does not recognize is left byte-for-byte intact, and other "
                "diagram types pass through untouched."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return kTools;
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        for (const ToolInfo &info : kTools)
        {
            if (info.id == id || info.executable == id)
                return &info;
        }
        return nullptr;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        const ToolInfo *info = findTool(id);
        if (!info)
            throw std::runtime_error("no tool registered as '" + std::string(id) + "'");
        return *info;
    }

} // namespace mm::appinfo
