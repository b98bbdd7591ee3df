#include "mm/repair/trigger_set.hpp"

namespace mm::repair
{
namespace
{
bool isAcceptableTrigger(char ch) noexcept
{
    auto code = static_cast<unsigned char>(ch);
    if (code <= 0x20 || code >= 0x7f)
        return false;
    return ch != '"';
}
} // namespace

TriggerSet TriggerSet::extendedWith(std::string_view extra, std::string_view rejected) const noexcept
{
    TriggerSet result = *this;
    for (char ch : extra)
    {
        if (!isAcceptableTrigger(ch))
            continue;
        if (rejected.find(ch) != std::string_view::npos)
            continue;
        result.add(ch);
    }
    return result;
}

TriggerTables TriggerTables::fromOptions(const SanitizerOptions &options)
{
    TriggerTables tables;
    tables.node = kNodeLabelTriggers.extendedWith(options.extraNodeTriggers, "{}");
    tables.edge = kEdgeLabelTriggers.extendedWith(options.extraEdgeTriggers);
    return tables;
}

} // namespace mm::repair
