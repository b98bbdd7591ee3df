#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mm::repair
{

enum class LineKind
{
    Blank,
    Comment,
    Structural,
    Content
};

enum class LabelKind
{
    NodeLabel,
    EdgeLabel
};

enum class BracketStyle
{
    Square,
    Round,
    Curly,
    DoubleRound,
    DoubleSquare,
    Pipe
};

// One label located inside a content line.
//
// [start, end) covers the delimiters, [innerStart, innerEnd) the text
// between them. Offsets always fall on ASCII delimiters, so they are valid
// UTF-8 boundaries.
struct LabelSpan
{
    LabelKind kind = LabelKind::NodeLabel;
    BracketStyle style = BracketStyle::Square;
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t innerStart = 0;
    std::size_t innerEnd = 0;
    std::string rawInnerText;
    bool isQuoted = false;
};

struct Line
{
    std::size_t number = 0;
    std::string text;
    std::string ending;
    LineKind kind = LineKind::Content;
    // Labels are only scanned from here on; non-zero for a header line that
    // carries statements after its ';'.
    std::size_t scanFrom = 0;
    std::vector<LabelSpan> spans;
};

enum class RepairRule
{
    EscapeNormalizer,
    NestedQuoteResolver,
    EmptyEdgeLabel,
    SpecialCharQuoter,
    TrailingPunctuation
};

struct RepairRecord
{
    RepairRule rule = RepairRule::EscapeNormalizer;
    std::size_t line = 0;

    bool operator==(const RepairRecord &other) const noexcept
    {
        return rule == other.rule && line == other.line;
    }
};

enum class SanitizeStatus
{
    Unchanged,
    Fixed
};

struct SanitizeResult
{
    SanitizeStatus status = SanitizeStatus::Unchanged;
    std::string text;
    std::vector<RepairRecord> repairs;

    bool fixed() const noexcept { return status == SanitizeStatus::Fixed; }

    static SanitizeResult unchanged(std::string_view original)
    {
        SanitizeResult result;
        result.text.assign(original.begin(), original.end());
        return result;
    }
};

struct SanitizerOptions
{
    bool enabled = true;
    std::string extraNodeTriggers;
    std::string extraEdgeTriggers;
};

std::string_view ruleName(RepairRule rule) noexcept;
std::string_view statusName(SanitizeStatus status) noexcept;

} // namespace mm::repair
