#pragma once

#include <set>
#include <string>

namespace leakscan {
namespace scan {

// Longest value a single match may capture, in UTF-16 code units.
constexpr size_t MAX_VALUE_LENGTH = 5000;

// Strips one outer pair of matching single or double quotes.
std::string removeQuotes(const std::string& value);

// Extracts candidate secret values from line-oriented UTF-8 text.
//
// Two forms are recognized on every line:
//   NAME = value          (rest of the line; "value # comment" also yields "value")
//   "name": "value"       (flat JSON-like pairs, several per line)
// Matches never span lines. Results are unquoted and non-empty; the set
// carries no information about where in the text a value was found.
std::set<std::string> extractAssignedValues(const std::string& text);

} // namespace scan
} // namespace leakscan
