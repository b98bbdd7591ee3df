#include "mm/repair/scanner.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <array>

namespace mm::repair
{
namespace
{
enum class ScanState
{
    Outside,
    InNodeLabel,
    InEdgeLabel,
    InQuote
};

struct ShapeSyntax
{
    std::string_view opener;
    std::string_view closer;
    BracketStyle style;
    bool modelled;
};

// Longest opener first. Shapes that are not modelled are stepped over
// without producing a span, so nothing inside them is ever rewritten.
constexpr std::array<ShapeSyntax, 12> kNodeShapes{{
    {"(((", ")))", BracketStyle::Round, false},
    {"[[", "]]", BracketStyle::DoubleSquare, true},
    {"[(", ")]", BracketStyle::Square, false},
    {"[/", "]", BracketStyle::Square, false},
    {"[\\", "]", BracketStyle::Square, false},
    {"((", "))", BracketStyle::DoubleRound, true},
    {"([", "])", BracketStyle::Round, false},
    {"{{", "}}", BracketStyle::Curly, false},
    {"[", "]", BracketStyle::Square, true},
    {"(", ")", BracketStyle::Round, true},
    {"{", "}", BracketStyle::Curly, true},
    {">", "]", BracketStyle::Square, false},
}};

const ShapeSyntax *matchShape(std::string_view text, std::size_t pos) noexcept
{
    for (const auto &shape : kNodeShapes)
    {
        if (text.compare(pos, shape.opener.size(), shape.opener) == 0)
            return &shape;
    }
    return nullptr;
}

class LabelCursor
{
public:
    LabelCursor(std::string_view text, std::size_t from)
        : text(text),
          pos(std::min(from, text.size()))
    {
    }

    std::vector<LabelSpan> run()
    {
        while (!abandoned)
        {
            if (state == ScanState::Outside && pos >= text.size())
                break;
            switch (state)
            {
            case ScanState::Outside:
                stepOutside();
                break;
            case ScanState::InNodeLabel:
            case ScanState::InEdgeLabel:
                stepLabel();
                break;
            case ScanState::InQuote:
                stepQuote();
                break;
            }
        }
        return std::move(spans);
    }

private:
    struct PendingLabel
    {
        LabelKind kind = LabelKind::NodeLabel;
        BracketStyle style = BracketStyle::Square;
        std::size_t start = 0;
        std::size_t innerStart = 0;
        char open = '[';
        std::string_view closer;
        bool quoteTried = false;
    };

    void stepOutside()
    {
        char ch = text[pos];
        if (detail::isIdentifierChar(ch))
        {
            while (pos < text.size() && detail::isIdentifierChar(text[pos]))
                ++pos;
            if (pos < text.size())
                openNodeLabel(pos);
            return;
        }
        if (detail::isArrowChar(ch))
        {
            std::size_t end = arrowEnd(pos);
            if (end == pos)
            {
                ++pos;
                return;
            }
            pos = end;
            std::size_t next = end;
            while (next < text.size() && detail::isInlineSpace(text[next]))
                ++next;
            if (next < text.size() && text[next] == '|')
                openEdgeLabel(next);
            return;
        }
        if (ch == '%' && pos + 1 < text.size() && text[pos + 1] == '%')
        {
            pos = text.size();
            return;
        }
        if (ch == '@' && pos + 1 < text.size() && text[pos + 1] == '{')
        {
            skipPast("}", pos + 2);
            return;
        }
        if (ch == '"')
        {
            skipPast("\"", pos + 1);
            return;
        }
        ++pos;
    }

    void stepLabel()
    {
        if (!pending.quoteTried && pos < text.size() && text[pos] == '"')
        {
            state = ScanState::InQuote;
            return;
        }
        std::size_t close = findStructuralCloser(pending.innerStart);
        if (close == std::string_view::npos)
        {
            abandoned = true;
            return;
        }
        emit(close);
    }

    void stepQuote()
    {
        std::size_t close = findQuotedCloser(pending.innerStart + 1);
        if (close != std::string_view::npos)
        {
            std::size_t bracket = findStructuralCloser(pending.innerStart);
            if (bracket == std::string_view::npos || bracket > close)
            {
                emit(close + 1);
                return;
            }
            // The label's own closer comes before the closing quote, so the
            // quote belongs to a later label. Step over this one untouched.
            pos = bracket + pending.closer.size();
            state = ScanState::Outside;
            return;
        }
        pending.quoteTried = true;
        state = pending.kind == LabelKind::EdgeLabel ? ScanState::InEdgeLabel : ScanState::InNodeLabel;
    }

    void openNodeLabel(std::size_t openerPos)
    {
        const ShapeSyntax *shape = matchShape(text, openerPos);
        if (!shape)
            return;
        if (!shape->modelled)
        {
            skipPast(shape->closer, openerPos + shape->opener.size());
            return;
        }
        pending = PendingLabel{};
        pending.kind = LabelKind::NodeLabel;
        pending.style = shape->style;
        pending.start = openerPos;
        pending.innerStart = openerPos + shape->opener.size();
        pending.open = shape->opener.front();
        pending.closer = shape->closer;
        pos = pending.innerStart;
        state = ScanState::InNodeLabel;
    }

    void openEdgeLabel(std::size_t pipePos)
    {
        pending = PendingLabel{};
        pending.kind = LabelKind::EdgeLabel;
        pending.style = BracketStyle::Pipe;
        pending.start = pipePos;
        pending.innerStart = pipePos + 1;
        pending.open = '|';
        pending.closer = "|";
        pos = pending.innerStart;
        state = ScanState::InEdgeLabel;
    }

    // -->, ---, -.->, ==>, <-->, ~~~ and the o/x headed variants.
    std::size_t arrowEnd(std::size_t from) const noexcept
    {
        std::size_t end = from;
        int strokes = 0;
        int tildes = 0;
        while (end < text.size() && detail::isArrowChar(text[end]))
        {
            if (text[end] == '-' || text[end] == '=')
                ++strokes;
            else if (text[end] == '~')
                ++tildes;
            ++end;
        }
        if (strokes < 2 && tildes < 3)
            return from;
        char last = text[end - 1];
        if (end < text.size() && (text[end] == 'o' || text[end] == 'x') && (last == '-' || last == '='))
        {
            if (end + 1 >= text.size() || !detail::isIdentifierChar(text[end + 1]))
                ++end;
        }
        return end;
    }

    bool isEscaped(std::size_t at) const noexcept
    {
        std::size_t backslashes = 0;
        while (at > backslashes && text[at - backslashes - 1] == '\\')
            ++backslashes;
        return backslashes % 2 == 1;
    }

    std::size_t findQuotedCloser(std::size_t from) const noexcept
    {
        for (std::size_t i = from; i < text.size(); ++i)
        {
            if (text[i] != '"' || isEscaped(i))
                continue;
            if (text.compare(i + 1, pending.closer.size(), pending.closer) == 0)
                return i;
        }
        return std::string_view::npos;
    }

    // Matching closer allowing exactly one level of nested brackets.
    std::size_t findStructuralCloser(std::size_t from) const noexcept
    {
        if (pending.kind == LabelKind::EdgeLabel)
        {
            for (std::size_t i = from; i < text.size(); ++i)
            {
                if (text[i] == '|' && !isEscaped(i))
                    return i;
            }
            return std::string_view::npos;
        }

        const char closeChar = pending.closer.front();
        int depth = 0;
        for (std::size_t i = from; i < text.size(); ++i)
        {
            if (depth == 0 && text.compare(i, pending.closer.size(), pending.closer) == 0)
                return i;
            char ch = text[i];
            if (ch == pending.open)
            {
                if (++depth > 1)
                    return std::string_view::npos;
            }
            else if (ch == closeChar)
            {
                if (depth == 0)
                    return std::string_view::npos;
                --depth;
            }
        }
        return std::string_view::npos;
    }

    void skipPast(std::string_view closer, std::size_t from)
    {
        std::size_t close = text.find(closer, from);
        if (close == std::string_view::npos)
        {
            abandoned = true;
            return;
        }
        pos = close + closer.size();
    }

    void emit(std::size_t innerEnd)
    {
        LabelSpan span;
        span.kind = pending.kind;
        span.style = pending.style;
        span.start = pending.start;
        span.innerStart = pending.innerStart;
        span.innerEnd = innerEnd;
        span.end = innerEnd + pending.closer.size();
        span.rawInnerText.assign(text.substr(span.innerStart, innerEnd - span.innerStart));
        span.isQuoted = span.rawInnerText.size() >= 2 && span.rawInnerText.front() == '"' &&
                        span.rawInnerText.back() == '"';
        spans.push_back(std::move(span));
        pos = innerEnd + pending.closer.size();
        state = ScanState::Outside;
    }

    std::string_view text;
    std::size_t pos = 0;
    ScanState state = ScanState::Outside;
    bool abandoned = false;
    PendingLabel pending;
    std::vector<LabelSpan> spans;
};

} // namespace

std::vector<LabelSpan> scanLabels(std::string_view text, std::size_t from)
{
    LabelCursor cursor(text, from);
    return cursor.run();
}

} // namespace mm::repair
