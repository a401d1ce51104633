#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace filerelay::core {

using QueryParams = std::map<std::string, std::string, std::less<>>;

// Splits an origin-form target "/path?a=1&b=2" into its path and decoded
// parameters. '+' in the query is a space. A key without '=' maps to an empty
// value; a later duplicate wins. Returns nullopt when the target does not parse.
struct RequestTarget {
    std::string path;
    QueryParams params;
};

std::optional<RequestTarget> ParseRequestTarget(std::string_view target);

// Decodes %XX escapes only, '+' stays literal. Returns nullopt on a bad escape.
std::optional<std::string> PercentDecode(std::string_view encoded);

} // namespace filerelay::core
