#pragma once

#include "mm/repair/types.hpp"

#include <array>
#include <string_view>

namespace mm::repair
{

// Fixed ASCII lookup table of characters that force a label to be quoted.
class TriggerSet
{
public:
    constexpr TriggerSet() = default;

    constexpr explicit TriggerSet(std::string_view characters) noexcept
    {
        for (char ch : characters)
            add(ch);
    }

    constexpr bool contains(char ch) const noexcept
    {
        auto index = static_cast<unsigned char>(ch);
        return index < table.size() && table[index];
    }

    constexpr bool matchesAny(std::string_view text) const noexcept
    {
        for (char ch : text)
        {
            if (contains(ch))
                return true;
        }
        return false;
    }

    // Returns a copy extended with |extra|. Quotes, whitespace, control and
    // non-ASCII bytes are never accepted as triggers.
    TriggerSet extendedWith(std::string_view extra, std::string_view rejected = {}) const noexcept;

private:
    constexpr void add(char ch) noexcept
    {
        auto index = static_cast<unsigned char>(ch);
        if (index < table.size())
            table[index] = true;
    }

    std::array<bool, 128> table{};
};

// Node labels: curly braces select the diamond shape and are never data.
inline constexpr TriggerSet kNodeLabelTriggers{".!:&|()"};

// Edge labels: curly braces are literal text (tuples, maps) and need quoting.
inline constexpr TriggerSet kEdgeLabelTriggers{".!:&|(){}"};

struct TriggerTables
{
    TriggerSet node = kNodeLabelTriggers;
    TriggerSet edge = kEdgeLabelTriggers;

    const TriggerSet &forKind(LabelKind kind) const noexcept
    {
        return kind == LabelKind::EdgeLabel ? edge : node;
    }

    static TriggerTables fromOptions(const SanitizerOptions &options);
};

} // namespace mm::repair
