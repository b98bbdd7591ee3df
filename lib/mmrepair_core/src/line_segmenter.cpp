#include "mm/repair/scanner.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <array>

namespace mm::repair
{
namespace
{
constexpr std::array<std::string_view, 12> kStructuralKeywords{{
    "flowchart",
    "graph",
    "subgraph",
    "end",
    "style",
    "click",
    "classDef",
    "class",
    "linkStyle",
    "direction",
    "accTitle",
    "accDescr",
}};

bool isStructuralKeyword(std::string_view token) noexcept
{
    return std::find(kStructuralKeywords.begin(), kStructuralKeywords.end(), token) != kStructuralKeywords.end();
}

bool isDiagramHeader(std::string_view token) noexcept
{
    return token == "flowchart" || token == "graph";
}
} // namespace

std::size_t headerStatementOffset(std::string_view text) noexcept
{
    std::string_view body = detail::stripByteOrderMark(text);
    std::size_t bomSize = text.size() - body.size();
    if (!isDiagramHeader(leadingToken(detail::trim(body))))
        return std::string_view::npos;

    std::size_t semicolon = body.find(';');
    if (semicolon == std::string_view::npos)
        return std::string_view::npos;
    if (body.find_first_not_of(" \t\r;", semicolon) == std::string_view::npos)
        return std::string_view::npos;
    return bomSize + semicolon + 1;
}

LineKind classifyLine(std::string_view text) noexcept
{
    std::string_view trimmed = detail::trim(detail::stripByteOrderMark(text));
    if (trimmed.empty())
        return LineKind::Blank;
    // Config directives (%%{init: ...}%%) are comments as far as repair goes.
    if (trimmed.starts_with("%%"))
        return LineKind::Comment;
    if (isStructuralKeyword(leadingToken(trimmed)))
        return headerStatementOffset(text) == std::string_view::npos ? LineKind::Structural : LineKind::Content;
    return LineKind::Content;
}

std::vector<Line> segmentLines(std::string_view source)
{
    std::vector<Line> lines;
    std::size_t offset = 0;
    bool inFrontMatter = false;
    while (offset < source.size())
    {
        Line line;
        line.number = lines.size() + 1;

        std::size_t newline = source.find('\n', offset);
        std::size_t textEnd = newline == std::string_view::npos ? source.size() : newline;
        std::size_t next = newline == std::string_view::npos ? source.size() : newline + 1;
        if (newline != std::string_view::npos && textEnd > offset && source[textEnd - 1] == '\r')
            --textEnd;
        line.text.assign(source.substr(offset, textEnd - offset));
        line.ending.assign(source.substr(textEnd, next - textEnd));
        offset = next;

        std::string_view trimmed = detail::trim(detail::stripByteOrderMark(line.text));
        if (line.number == 1 && trimmed == "---")
        {
            inFrontMatter = true;
            line.kind = LineKind::Structural;
        }
        else if (inFrontMatter)
        {
            if (trimmed == "---")
                inFrontMatter = false;
            line.kind = LineKind::Structural;
        }
        else
        {
            line.kind = classifyLine(line.text);
        }

        if (line.kind == LineKind::Content)
        {
            std::size_t statements = headerStatementOffset(line.text);
            if (statements != std::string_view::npos)
                line.scanFrom = statements;
            line.spans = scanLabels(line.text, line.scanFrom);
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string joinLines(const std::vector<Line> &lines)
{
    std::size_t total = 0;
    for (const auto &line : lines)
        total += line.text.size() + line.ending.size();

    std::string result;
    result.reserve(total);
    for (const auto &line : lines)
    {
        result += line.text;
        result += line.ending;
    }
    return result;
}

void rescanLine(Line &line)
{
    if (line.kind == LineKind::Content)
        line.spans = scanLabels(line.text, line.scanFrom);
    else
        line.spans.clear();
}

} // namespace mm::repair
