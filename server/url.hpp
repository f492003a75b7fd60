// url.hpp
#pragma once
#include <map>
#include <string>
#include <vector>

struct RequestTarget {
    std::vector<std::string> segments;          // decoded, empty ones dropped
    std::map<std::string, std::string> query;   // decoded, last value wins
};

// Decodes %XX escapes. With plus_as_space, '+' becomes ' ' (query strings).
// A '%' not followed by two hex digits is kept as a literal character.
std::string percent_decode(const std::string& in, bool plus_as_space = false);

// Splits "/a%2Fb/c?x=1&y" into segments and query parameters. Segments are
// split before decoding so an encoded '/' stays inside its segment.
RequestTarget parse_target(const std::string& target);
