#pragma once

#include "mm/repair/trigger_set.hpp"
#include "mm/repair/types.hpp"

#include <string>
#include <string_view>

namespace mm::repair
{

// Every pass rewrites a single content line in place and returns true only
// when the line text changed; the line's spans are rescanned afterwards.
// A span the pass does not understand is left exactly as it is.

// Inside quoted labels: \" and \' become ', any other backslash is dropped.
bool normalizeEscapes(Line &line);

// Inside quoted labels: removes literal " characters between the delimiters.
bool resolveNestedQuotes(Line &line);

// -->|""| D becomes --> D, for every arrow family.
bool stripEmptyEdgeLabels(Line &line);

// Wraps unquoted labels containing a trigger character in double quotes.
// Diamond node shapes ({...}) are never quoted.
bool quoteSpecialCharacters(Line &line, const TriggerTables &triggers);

// Drops a sentence-style '.' following the last label of the line.
bool stripTrailingPunctuation(Line &line);

std::string normalizeEscapeSequences(std::string_view body);

} // namespace mm::repair
