#pragma once

#include "mm/repair/types.hpp"

#include <string_view>
#include <vector>

namespace mm::repair
{

enum class DiagramDialect
{
    Empty,
    Flowchart,
    Other
};

// Leading keyword of a line: the run of characters up to the first
// whitespace, ';' or ':'.
std::string_view leadingToken(std::string_view line) noexcept;

// Classifies a diagram by the first line that is not blank, a comment or
// part of the YAML front matter block.
DiagramDialect classifyDialect(std::string_view source) noexcept;
bool isRepairableDialect(std::string_view source) noexcept;

// Splits |source| into lines that keep their exact text and terminator;
// concatenating text + ending of every line reproduces |source|. Content
// lines come back with their label spans already scanned.
std::vector<Line> segmentLines(std::string_view source);
LineKind classifyLine(std::string_view text) noexcept;
std::string joinLines(const std::vector<Line> &lines);

// Locates node and edge labels in one content line, left to right, starting
// at byte |from|. Spans never overlap. Scanning stops at the first construct
// that cannot be matched confidently; spans found before it are kept.
std::vector<LabelSpan> scanLabels(std::string_view text, std::size_t from = 0);

// Offset of the first statement written after ';' on a diagram header line
// ("graph TD; A --> B"), or npos when the line declares nothing else.
std::size_t headerStatementOffset(std::string_view text) noexcept;

// Re-runs the label scanner after a pass has rewritten the line text.
void rescanLine(Line &line);

} // namespace mm::repair
