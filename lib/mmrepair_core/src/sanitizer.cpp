#include "mm/repair/sanitizer.hpp"

#include "mm/repair/passes.hpp"
#include "mm/repair/scanner.hpp"
#include "mm/repair/trigger_set.hpp"

#include <array>

namespace mm::repair
{
namespace
{
using PassFn = bool (*)(Line &, const TriggerTables &);

struct RepairPass
{
    RepairRule rule;
    PassFn apply;
};

// Escapes first so later passes never mistake \" for a label delimiter.
constexpr std::array<RepairPass, 5> kPasses{{
    {RepairRule::EscapeNormalizer, [](Line &line, const TriggerTables &) { return normalizeEscapes(line); }},
    {RepairRule::NestedQuoteResolver, [](Line &line, const TriggerTables &) { return resolveNestedQuotes(line); }},
    {RepairRule::EmptyEdgeLabel, [](Line &line, const TriggerTables &) { return stripEmptyEdgeLabels(line); }},
    {RepairRule::SpecialCharQuoter,
     [](Line &line, const TriggerTables &triggers) { return quoteSpecialCharacters(line, triggers); }},
    {RepairRule::TrailingPunctuation, [](Line &line, const TriggerTables &) { return stripTrailingPunctuation(line); }},
}};

} // namespace

std::string_view ruleName(RepairRule rule) noexcept
{
    switch (rule)
    {
    case RepairRule::EscapeNormalizer:
        return "escape_normalizer";
    case RepairRule::NestedQuoteResolver:
        return "nested_quote_resolver";
    case RepairRule::EmptyEdgeLabel:
        return "empty_edge_label";
    case RepairRule::SpecialCharQuoter:
        return "special_char_quoter";
    case RepairRule::TrailingPunctuation:
        return "trailing_punctuation";
    }
    return "unknown";
}

std::string_view statusName(SanitizeStatus status) noexcept
{
    return status == SanitizeStatus::Fixed ? "fixed" : "unchanged";
}

SanitizeResult sanitize(std::string_view source)
{
    return sanitize(source, SanitizerOptions{});
}

SanitizeResult sanitize(std::string_view source, const SanitizerOptions &options)
{
    if (!options.enabled || !isRepairableDialect(source))
        return SanitizeResult::unchanged(source);

    const TriggerTables triggers = TriggerTables::fromOptions(options);
    std::vector<Line> lines = segmentLines(source);
    std::vector<RepairRecord> repairs;
    for (Line &line : lines)
    {
        if (line.kind != LineKind::Content)
            continue;
        for (const auto &pass : kPasses)
        {
            if (pass.apply(line, triggers))
                repairs.push_back({pass.rule, line.number});
        }
    }
    return detectChanges(source, joinLines(lines), std::move(repairs));
}

SanitizeResult detectChanges(std::string_view original, std::string rebuilt, std::vector<RepairRecord> repairs)
{
    if (rebuilt == original)
        return SanitizeResult::unchanged(original);

    SanitizeResult result;
    result.status = SanitizeStatus::Fixed;
    result.text = std::move(rebuilt);
    result.repairs = std::move(repairs);
    return result;
}

} // namespace mm::repair
