#pragma once

#include <cstddef>
#include <string_view>

namespace mm::repair::detail
{

inline bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

inline bool isInlineSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

// Node ids: ASCII letters, digits, underscore and any UTF-8 multi-byte
// sequence byte.
inline bool isIdentifierChar(char ch) noexcept
{
    auto code = static_cast<unsigned char>(ch);
    if (code >= 0x80)
        return true;
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
}

inline bool isArrowChar(char ch) noexcept
{
    return ch == '-' || ch == '=' || ch == '.' || ch == '<' || ch == '>' || ch == '~';
}

inline std::string_view trim(std::string_view view) noexcept
{
    std::size_t start = 0;
    while (start < view.size() && isWhitespace(view[start]))
        ++start;
    std::size_t end = view.size();
    while (end > start && isWhitespace(view[end - 1]))
        --end;
    return view.substr(start, end - start);
}

inline std::string_view stripByteOrderMark(std::string_view view) noexcept
{
    if (view.size() >= 3 && view.compare(0, 3, "\xEF\xBB\xBF") == 0)
        return view.substr(3);
    return view;
}

} // namespace mm::repair::detail
