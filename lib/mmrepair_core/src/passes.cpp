#include "mm/repair/passes.hpp"

#include "mm/repair/scanner.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace mm::repair
{
namespace
{
struct TextEdit
{
    std::size_t start = 0;
    std::size_t end = 0;
    std::string replacement;
};

// |edits| are ordered left to right and never overlap.
bool applyEdits(Line &line, const std::vector<TextEdit> &edits)
{
    if (edits.empty())
        return false;
    std::string text = line.text;
    for (auto it = edits.rbegin(); it != edits.rend(); ++it)
        text.replace(it->start, it->end - it->start, it->replacement);
    if (text == line.text)
        return false;
    line.text = std::move(text);
    rescanLine(line);
    return true;
}

std::string_view quotedBody(const LabelSpan &span) noexcept
{
    std::string_view raw(span.rawInnerText);
    return raw.substr(1, raw.size() - 2);
}

// Opening bracket for a label closer, or '\0' for anything else.
char openerFor(char closer) noexcept
{
    switch (closer)
    {
    case ']':
        return '[';
    case ')':
        return '(';
    case '}':
        return '{';
    default:
        return '\0';
    }
}

} // namespace

std::string normalizeEscapeSequences(std::string_view body)
{
    std::string result;
    result.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i)
    {
        char ch = body[i];
        if (ch != '\\')
        {
            result.push_back(ch);
            continue;
        }
        if (i + 1 < body.size() && (body[i + 1] == '"' || body[i + 1] == '\''))
        {
            result.push_back('\'');
            ++i;
        }
        // Mermaid labels have no escape syntax: any other backslash goes and
        // the character after it is kept as written.
    }
    return result;
}

bool normalizeEscapes(Line &line)
{
    std::vector<TextEdit> edits;
    for (const auto &span : line.spans)
    {
        if (!span.isQuoted)
            continue;
        std::string_view body = quotedBody(span);
        if (body.find('\\') == std::string_view::npos)
            continue;
        edits.push_back({span.innerStart + 1, span.innerEnd - 1, normalizeEscapeSequences(body)});
    }
    return applyEdits(line, edits);
}

bool resolveNestedQuotes(Line &line)
{
    std::vector<TextEdit> edits;
    for (const auto &span : line.spans)
    {
        if (!span.isQuoted)
            continue;
        std::string_view body = quotedBody(span);
        if (body.find('"') == std::string_view::npos)
            continue;
        std::string flattened;
        flattened.reserve(body.size());
        std::copy_if(body.begin(), body.end(), std::back_inserter(flattened), [](char ch) { return ch != '"'; });
        edits.push_back({span.innerStart + 1, span.innerEnd - 1, std::move(flattened)});
    }
    return applyEdits(line, edits);
}

bool stripEmptyEdgeLabels(Line &line)
{
    std::vector<TextEdit> edits;
    const std::string &text = line.text;
    for (const auto &span : line.spans)
    {
        if (span.kind != LabelKind::EdgeLabel || span.rawInnerText != "\"\"")
            continue;
        std::size_t arrowEnd = span.start;
        while (arrowEnd > 0 && detail::isInlineSpace(text[arrowEnd - 1]))
            --arrowEnd;
        std::size_t next = span.end;
        while (next < text.size() && detail::isInlineSpace(text[next]))
            ++next;
        edits.push_back({arrowEnd, next, next < text.size() ? std::string(" ") : std::string()});
    }
    return applyEdits(line, edits);
}

bool quoteSpecialCharacters(Line &line, const TriggerTables &triggers)
{
    std::vector<TextEdit> edits;
    for (const auto &span : line.spans)
    {
        if (span.isQuoted || span.rawInnerText.empty())
            continue;
        if (span.kind == LabelKind::NodeLabel && span.style == BracketStyle::Curly)
            continue;
        // A stray quote or backslash cannot be wrapped without changing how
        // the label tokenizes; leave it for the renderer to report.
        if (span.rawInnerText.find_first_of("\"\\") != std::string::npos)
            continue;
        if (!triggers.forKind(span.kind).matchesAny(span.rawInnerText))
            continue;
        edits.push_back({span.innerStart, span.innerEnd, '"' + span.rawInnerText + '"'});
    }
    return applyEdits(line, edits);
}

bool stripTrailingPunctuation(Line &line)
{
    const std::string &text = line.text;
    std::size_t last = text.size();
    while (last > 0 && detail::isWhitespace(text[last - 1]))
        --last;
    if (last < 2 || text[last - 1] != '.')
        return false;

    std::size_t dot = last - 1;
    std::size_t bracket = dot - 1;
    if (text[bracket] == '"')
    {
        if (bracket == 0)
            return false;
        --bracket;
    }
    // Any node shape qualifies, including the ones the scanner steps over
    // (cylinders, stadiums, hexagons), as long as its opener is on the line.
    char opener = openerFor(text[bracket]);
    if (opener == '\0' || text.rfind(opener, bracket) == std::string::npos || bracket < line.scanFrom)
        return false;
    // Inside a trailing %% comment.
    std::size_t comment = text.find("%%", line.scanFrom);
    if (comment != std::string::npos && comment < bracket)
        return false;

    return applyEdits(line, {TextEdit{dot, dot + 1, std::string()}});
}

} // namespace mm::repair
