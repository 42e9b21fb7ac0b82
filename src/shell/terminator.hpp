#pragma once

#include <string>
#include <vector>

enum class TerminatorKind {
    PREFIX,     // "^text": accumulated output starts with text
    SUFFIX,     // "text$": accumulated output ends with text
    CONTAINS,   // "text":  text occurs anywhere
};

// A completion pattern telling the collector the shell has finished replying.
struct Terminator {
    TerminatorKind kind;
    std::string text;

    bool matches(const std::string& source) const;
};

// Parse caller-facing terminator strings.
// "^a" gives PREFIX "a", "a$" gives SUFFIX "a", anything else CONTAINS.
// Both anchors on one string yield both checks: "^a$" is PREFIX "a$" and
// SUFFIX "^a". A bare anchor ("^", "$") matches everything; empty strings
// yield nothing.
std::vector<Terminator> parse_terminators(const std::vector<std::string>& patterns);

// True if any terminator matches source.
bool has_terminator(const std::string& source, const std::vector<Terminator>& terminators);
bool has_terminator(const std::string& source, const std::vector<std::string>& patterns);
