#include "mm/repair/scanner.hpp"

#include "text_utils.hpp"

namespace mm::repair
{

std::string_view leadingToken(std::string_view line) noexcept
{
    std::string_view view = detail::stripByteOrderMark(line);
    std::size_t start = 0;
    while (start < view.size() && detail::isWhitespace(view[start]))
        ++start;
    std::size_t end = start;
    while (end < view.size() && !detail::isWhitespace(view[end]) && view[end] != ';' && view[end] != ':')
        ++end;
    return view.substr(start, end - start);
}

DiagramDialect classifyDialect(std::string_view source) noexcept
{
    std::size_t offset = 0;
    std::size_t index = 0;
    bool inFrontMatter = false;
    while (offset < source.size())
    {
        std::size_t newline = source.find('\n', offset);
        std::string_view line = newline == std::string_view::npos ? source.substr(offset)
                                                                  : source.substr(offset, newline - offset);
        offset = newline == std::string_view::npos ? source.size() : newline + 1;

        std::string_view trimmed = detail::trim(detail::stripByteOrderMark(line));
        if (index++ == 0 && trimmed == "---")
        {
            inFrontMatter = true;
            continue;
        }
        if (inFrontMatter)
        {
            if (trimmed == "---")
                inFrontMatter = false;
            continue;
        }
        if (trimmed.empty() || trimmed.starts_with("%%"))
            continue;

        std::string_view token = leadingToken(trimmed);
        if (token == "flowchart" || token == "graph")
            return DiagramDialect::Flowchart;
        return DiagramDialect::Other;
    }
    return DiagramDialect::Empty;
}

bool isRepairableDialect(std::string_view source) noexcept
{
    return classifyDialect(source) == DiagramDialect::Flowchart;
}

} // namespace mm::repair
